#include "cli_options.hpp"
#include "converter.hpp"
#include "errors.hpp"
#include "image.hpp"
#include "terminal.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ArgumentError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (opts.help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    try {
        if (opts.verbose) {
            std::cerr << "Loading: " << opts.image_path << std::endl;
        }
        PixelBuffer image = load_image(opts.image_path);

        GridSize terminal = DEFAULT_TERMINAL_SIZE;
        if (!opts.width && !opts.height) {
            terminal = create_terminal_probe()->output_size();
        }
        ConversionConfig config = opts.to_config(image.width(), image.height(), terminal);

        if (opts.verbose) {
            std::cerr << "Image:   " << image.width() << "x" << image.height() << std::endl;
            std::cerr << "Options: size=" << config.size.cols << "x" << config.size.rows
                      << ", mode=" << (config.use_blocks ? "blocks" : "half-blocks")
                      << ", tolerance=" << config.color_tolerance
                      << ", bw=" << (config.bw ? "yes" : "no") << std::endl;
        }

        std::string art = image.to_ansi(config);
        std::cout << art << std::flush;
        if (!std::cout) {
            std::cerr << "Error: failed to write output" << std::endl;
            return 1;
        }

        if (opts.verbose) {
            std::cerr << "Done!" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
