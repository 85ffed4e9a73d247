// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of SvdMmap.
//
// SvdMmap is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. SvdMmap is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with SvdMmap.
// If not, see <https://www.gnu.org/licenses/>.

#include "svdmmap/DeviceAssembler.hpp"
#include "svdmmap/HeaderEmitter.hpp"
#include "svdmmap/SvdLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef SVDMMAP_VERSION
#define SVDMMAP_VERSION "unknown"
#endif

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <INPUT_SVD>\n"
              << "\n"
              << "Generates a C++ header of memory-mapped register accessors from a\n"
              << "CMSIS-SVD device description.\n"
              << "\n"
              << "Optional:\n"
              << "  --link-mem               Print the link symbol addresses instead of the header\n"
              << "  --output <filepath>      Write to a file instead of standard output\n"
              << "  --link-prefix <prefix>   Link symbol prefix (default: "
              << svdmmap::kDefaultLinkPrefix << ")\n"
              << "  --version                Show the version and exit\n"
              << "  --help                   Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  SVDMMAP_LINK_PREFIX      Link symbol prefix when --link-prefix is absent\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " stm32f401.svd --output stm32f401_mmap.hpp\n"
              << "  " << program_name << " --link-mem stm32f401.svd >> memory.ld\n";
}

void write_output(const std::string& filepath, const std::string& text) {
    if (filepath.empty()) {
        std::cout << text;
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Cannot write to standard output");
        }
        return;
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    file << text;
    file.close();
    if (!file) {
        throw std::runtime_error("Cannot write file: " + filepath);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string input_filepath;
    std::string output_filepath;
    std::string link_prefix;
    bool link_prefix_given = false;
    bool link_mem = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "svd-mmap " << SVDMMAP_VERSION << "\n";
            return 0;
        } else if (arg == "--link-mem") {
            link_mem = true;
        } else if (arg == "--output" && i + 1 < argc) {
            output_filepath = argv[++i];
        } else if (arg == "--link-prefix" && i + 1 < argc) {
            link_prefix = argv[++i];
            link_prefix_given = true;
        } else if (!arg.starts_with("-") && input_filepath.empty()) {
            input_filepath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_filepath.empty()) {
        std::cerr << "Error: an input SVD file is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    svdmmap::GeneratorOptions options;
    if (link_prefix_given) {
        options.link_prefix = link_prefix;
    } else if (const char* env_prefix = std::getenv("SVDMMAP_LINK_PREFIX")) {
        options.link_prefix = env_prefix;
    }

    try {
        auto device = svdmmap::load_device_file(input_filepath);

        std::ostringstream out;
        if (link_mem) {
            svdmmap::write_link_mem(out, svdmmap::gen_link_mem(device, options));
        } else {
            auto generated = svdmmap::assemble_device(device, options);
            for (const auto& warning : generated.warnings) {
                std::cerr << "Warning: " << warning << "\n";
            }
            svdmmap::HeaderEmitter emitter(out, options);
            emitter.emit(generated);
        }

        write_output(output_filepath, out.str());

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
