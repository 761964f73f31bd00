#include "cmdprove.h"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        cmdprove::DriverOptions options = cmdprove::parseDriverArgs(argc, argv);
        if (options.showHelp) {
            cmdprove::printUsage(std::cout);
            return cmdprove::kExitPassed;
        }
        if (options.helpTopic) {
            if (!cmdprove::printApiHelp(*options.helpTopic, std::cout)) {
                std::cerr << "ERROR: No help available for topic: '" << *options.helpTopic << "'\n";
                return cmdprove::kExitUsage;
            }
            return cmdprove::kExitPassed;
        }

        cmdprove::Driver driver{std::move(options)};
        return driver.runAll();
    } catch (const cmdprove::HarnessError& ex) {
        std::cerr << "ERROR: " << ex.what() << '\n';
        return cmdprove::kExitUsage;
    } catch (const cmdprove::TestError& ex) {
        std::cerr << "TEST ERROR: " << ex.what() << '\n';
        return cmdprove::kExitAborted;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << '\n';
        return cmdprove::kExitAborted;
    }
}
