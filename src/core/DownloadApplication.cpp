#include <memory>

#include "core/DownloadApplication.hpp"
#include "core/DownloadManager.hpp"
#include "core/CurlTransferChannel.hpp"
#include "aux/JoiningThread.hpp"
#include "ui/UI.hpp"
#include "util/file.hpp"
#include "util/http.hpp"
#include "util/version.hpp"

static constexpr const char RDM_LOG_FILENAME[] = "rdm.log";

DownloadApplication::DownloadApplication(ApplicationOptions options)
    : _options(std::move(options))
{
}

DownloadApplication::~DownloadApplication() {}

int DownloadApplication::run()
{
    std::string stateDirectory = _options.stateDirectory.empty() ? getStateDirectory() : _options.stateDirectory;

    // The terminal belongs to curses, so log lines go to a file
    logging::setLevel(_options.logLevel);
    if (!logging::openFile(joinPath(stateDirectory, RDM_LOG_FILENAME)))
    {
        logging::setLevel(LogLevel::OFF);
    }
    logging::info("rdm {} starting with state in {}", RDM_VERSION, stateDirectory);

    http::ensureCurlInitialized();

    UI *activeUi = nullptr;
    DownloadManager manager(stateDirectory, makeCurlChannelFactory(), std::make_unique<PosixInstaller>(),
                            [&activeUi]()
                            {
                                if (activeUi)
                                    activeUi->stop();
                            });

    UI ui(manager);
    activeUi = &ui;

    // Joined before ui and manager go away, even if ui.run() throws
    std::unique_ptr<JoiningThread> updateCheck;
    if (manager.isAutoCheckEnabled())
    {
        updateCheck = std::make_unique<JoiningThread>([&manager, &ui]()
                                                      {
                                                          try
                                                          {
                                                              UpdateInfo info = manager.checkUpdates();
                                                              if (info.available)
                                                              {
                                                                  ui.setStatus("Version " + info.latestVersion +
                                                                               " is available; run 'install' in settings");
                                                              }
                                                          }
                                                          catch (const ManagerError &e)
                                                          {
                                                              logging::warn("Startup update check failed: {}", e.what());
                                                          }
                                                      });
    }

    ui.run();

    if (updateCheck)
    {
        updateCheck->join();
    }

    activeUi = nullptr;
    manager.shutdown();
    logging::info("rdm exiting");
    return 0;
}
