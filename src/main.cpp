// main.cpp

#include <iostream>
#include <exception>
#include "errors.hpp"
#include "frame_preprocessor.hpp"
#include "options.hpp"

int main(int argc, char** argv) {
    try {
        // 1. Command line (and optional config file)
        PreprocessOptions options;
        std::string error;
        ArgsStatus status = parse_args(argc, argv, options, error);
        if (status == ArgsStatus::Help) {
            print_usage();
            return 0;
        }
        if (status == ArgsStatus::Usage) {
            std::cerr << error << std::endl;
            print_usage();
            return 2;
        }

        // 2. Instantiate the preprocessor (which validates the options)
        FramePreprocessor preprocessor(options);

        // 3. Select, correct, fade and export the frames
        PreprocessReport report = preprocessor.run();
        if (!report.failures.empty()) {
            std::cerr << report.failures.size() << " frames failed, see log for details" << std::endl;
        }

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration Error: " << e.what() << std::endl;
        return 1;
    } catch (const EmptyInputError& e) {
        std::cerr << "Nothing to export: " << e.what() << std::endl;
        return 1;
    } catch (const IoError& e) {
        std::cerr << "Fatal Error during setup: " << e.what() << std::endl;
        std::cerr << "Action Required: Check output directory and permissions." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        // Catch any other general exceptions
        std::cerr << "Unhandled Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
