#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <string>
#include <fstream>
#include <cstdint>

// Sequential writer for a transfer's destination file. Opening with a non-zero
// offset keeps the first offset bytes and discards anything after them.
class FileWriter
{
public:
    FileWriter(const std::string &filePath, std::uint64_t resumeOffset);
    ~FileWriter();

    bool isOpen() const;
    bool write(const char *data, size_t size);
    bool flush();

    // Discards everything written so far and continues from offset zero
    bool restart();

    std::uint64_t getPosition() const { return _position; }

private:
    std::string _filePath;
    std::ofstream _out;
    std::uint64_t _position{0};
};

#endif
