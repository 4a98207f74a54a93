#include <AbslLogCompat.hpp>
#include <CommandLine.hpp>
#include <filesystem>
#include <stdexcept>
#include <system_error>

CommandLine::CommandLine(CommandLine::argc_type argc,
                         CommandLine::argv_type argv)
    : _argc(argc), _argv(argv) {
    std::error_code ec;
    if (_argv == nullptr || _argv[0] == nullptr) {
        LOG(ERROR) << "Invalid argv passed";
        throw std::invalid_argument("Invalid argv passed");
    }

    const auto p1 = std::filesystem::current_path(ec) / argv[0];
    exePath = std::filesystem::canonical(p1, ec);
    if (ec) {
        DLOG(WARNING) << p1 << ": " << ec.message();
        exePath = argv[0];
    } else {
        DLOG(INFO) << exePath << ": OK";
    }
}

CommandLine::argv_type CommandLine::argv() const { return _argv; }

CommandLine::argc_type CommandLine::argc() const { return _argc; }

std::filesystem::path CommandLine::exe() const { return exePath; }
