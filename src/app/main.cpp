#include <iostream>

#include "app/ScreenshotService.hpp"
#include "app/cli.hpp"
#include "desktop/X11Desktop.hpp"
#include "platform/Log.hpp"

int main(int argc, char** argv) {
    using namespace winshot;

    initFileLogging();

    CliOptions options;
    std::string err;
    if (!parseCli(argc, argv, options, err)) {
        LOG_ERROR("%s", err.c_str());
        printUsage(std::cerr, argv[0]);
        closeFileLogging();
        return 2;
    }
    if (options.help) {
        printUsage(std::cout, argv[0]);
        closeFileLogging();
        return 0;
    }

    setDebugLogging(options.debug);

    ScreenshotService service(CreateX11Desktop);
    ToolResponse response;
    switch (options.command) {
        case Command::ListWindows:
            response = service.listWindows(options.listWindows);
            break;
        case Command::ListMonitors:
            response = service.listMonitors();
            break;
        case Command::Screenshot:
            response = service.takeScreenshot(options.screenshot);
            break;
        case Command::None:
            printUsage(std::cerr, argv[0]);
            closeFileLogging();
            return 2;
    }

    if (response.isError) {
        std::cerr << response.text << "\n";
    } else {
        std::cout << response.text << "\n";
    }
    closeFileLogging();
    return response.isError ? 1 : 0;
}
