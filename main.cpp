#include "BoardShim.hpp"
#include "DataHandler.hpp"
#include "SessionConfig.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace {

void SaveOrThrow(const DataHandler& handler, const std::string& filename) {
    if (!handler.SaveCsv(filename)) {
        throw BoardException("unable to save " + filename, StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
}

void Run(const SessionConfig& config) {
    BoardShim::SetLogLevel(config.logLevel);

    BoardShim boardShim(config.boardId, config.port);

    boardShim.PrepareSession();
    std::cout << "Session is ready" << std::endl;

    boardShim.StartStream(config.bufferSize);
    std::cout << "Started" << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(config.streamMs));

    boardShim.StopStream();
    std::cout << "Stopped" << std::endl;

    std::cout << "data count: " << boardShim.GetBoardDataCount() << std::endl;
    SampleMatrix unprocessedData = boardShim.GetBoardData();

    // serialization
    DataHandler handler(config.boardId, unprocessedData);
    SaveOrThrow(handler, config.outputRaw);
    DataHandler reloaded(config.boardId, config.outputRaw);
    SaveOrThrow(reloaded, config.outputReloaded);

    // preprocessing
    reloaded.RemoveDcOffset();
    reloaded.Bandpass(config.bandpassLow, config.bandpassHigh);
    SaveOrThrow(reloaded, config.outputProcessed);

    boardShim.ReleaseSession();
    std::cout << "Released" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cout << "Usage: " << argv[0] << " [config.json]" << std::endl;
        std::cout << "Example: " << argv[0] << " cyton.json" << std::endl;
        return 1;
    }

    try {
        SessionConfig config = argc == 2 ? LoadSessionConfig(argv[1]) : SessionConfig();
        Run(config);
    } catch (const BoardException& e) {
        std::cerr << "Failed: " << e.what() << std::endl;
        return e.GetExitCodeValue();
    } catch (const std::exception& e) {
        std::cerr << "Failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
