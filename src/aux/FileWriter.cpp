#include <filesystem>
#include <system_error>

#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string &fp, std::uint64_t resumeOffset)
    : _filePath(fp)
{
    std::ios::openmode mode = std::ios::binary; // Open file in binary mode

    if (resumeOffset > 0)
    {
        // Cut the file back to the confirmed offset; bytes past it were never acknowledged
        std::error_code ec;
        std::filesystem::resize_file(fp, resumeOffset, ec);
        if (ec)
        {
            return; // Leaves the writer closed
        }

        mode |= std::ios::app; // Append bytes to end of file
        _position = resumeOffset;
    }
    else
    {
        mode |= std::ios::trunc; // Overwrite existing file
    }

    _out.open(fp, mode);
}

FileWriter::~FileWriter()
{
    // Close file in destructor if still open
    if (_out.is_open())
    {
        _out.close();
    }
}

bool FileWriter::isOpen() const
{
    return _out.is_open();
}

bool FileWriter::write(const char *data, size_t size)
{
    if (!_out.is_open())
    {
        return false;
    }

    // Write data to file stream
    _out.write(data, static_cast<std::streamsize>(size));
    if (!_out)
    {
        return false;
    }

    _position += size;
    return true;
}

bool FileWriter::flush()
{
    if (!_out.is_open())
    {
        return false;
    }

    _out.flush();
    return static_cast<bool>(_out);
}

bool FileWriter::restart()
{
    if (_out.is_open())
    {
        _out.close();
    }

    _out.clear();
    _out.open(_filePath, std::ios::binary | std::ios::trunc);
    _position = 0;
    return _out.is_open();
}
