#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <stdexcept>
#include <chrono>
#include <filesystem> // For deriving the default output path

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp> // For imread, imwrite
#include <opencv2/imgproc.hpp>   // For BGR <-> RGB conversion

#include "cacorr/correction.hpp"
#include "cacorr/parameters.hpp"

// --- Default Configuration Values ---
// These can be overridden by command-line arguments
struct Config {
    std::string input_image_path;
    std::string output_image_path; // Empty: <input stem>_corrected.png beside the input
    std::string pad_mode = "zero";  // 'zero', 'reflect' or 'none'
    cacorr::FilterParameters params;
};

// --- Simple Argument Parser ---
void printUsage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " --input <path> [options]\n\n"
              << "Options:\n"
              << "  --input <path>       Input image file path (required)\n"
              << "  --output <path>      Output image file path (default: <input>_corrected.png)\n"
              << "  --L_hor <int>        Horizontal half-window (default: 14)\n"
              << "  --L_ver <int>        Vertical half-window (default: 4)\n"
              << "  --rho <a,b,c>        TI prefilter coefficients (default: -0.25,1.375,-0.125)\n"
              << "  --tau <float>        Chroma sign threshold (default: 15/255)\n"
              << "  --alpha_R <float>    Red FC regularization (default: 0.5)\n"
              << "  --alpha_B <float>    Blue FC regularization (default: 1.0)\n"
              << "  --beta_R <float>     Red arbitration bias (default: 1.0)\n"
              << "  --beta_B <float>     Blue arbitration bias (default: 0.25)\n"
              << "  --gamma_1 <float>    Upper normalization bound (default: 128/255)\n"
              << "  --gamma_2 <float>    Lower normalization bound (default: 64/255)\n"
              << "  --pad <mode>         Border padding: 'zero', 'reflect' or 'none' (default: zero)\n"
              << "  --clip               Clamp the corrected image to [0, 1]\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

bool parseRho(const std::string& text, cv::Vec3f& rho) {
    std::stringstream ss(text);
    std::string item;
    std::vector<float> values;
    while (std::getline(ss, item, ',')) {
        try { values.push_back(std::stof(item)); }
        catch (const std::exception&) { return false; }
    }
    if (values.size() != 3) {
        return false;
    }
    rho = cv::Vec3f(values[0], values[1], values[2]);
    return true;
}

bool parseArgs(int argc, char* argv[], Config& config) {
    cacorr::FilterParameters& p = config.params;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return false; // Indicate exit
        } else if (arg == "--input" && i + 1 < argc) {
            config.input_image_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_image_path = argv[++i];
        } else if (arg == "--L_hor" && i + 1 < argc) {
            try { p.L_hor = std::stoi(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid integer for --L_hor\n"; return false; }
        } else if (arg == "--L_ver" && i + 1 < argc) {
            try { p.L_ver = std::stoi(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid integer for --L_ver\n"; return false; }
        } else if (arg == "--rho" && i + 1 < argc) {
            if (!parseRho(argv[++i], p.rho)) {
                std::cerr << "Error: --rho expects exactly three comma-separated floats\n";
                return false;
            }
        } else if (arg == "--tau" && i + 1 < argc) {
            try { p.tau = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --tau\n"; return false; }
        } else if (arg == "--alpha_R" && i + 1 < argc) {
            try { p.alpha_R = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --alpha_R\n"; return false; }
        } else if (arg == "--alpha_B" && i + 1 < argc) {
            try { p.alpha_B = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --alpha_B\n"; return false; }
        } else if (arg == "--beta_R" && i + 1 < argc) {
            try { p.beta_R = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --beta_R\n"; return false; }
        } else if (arg == "--beta_B" && i + 1 < argc) {
            try { p.beta_B = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --beta_B\n"; return false; }
        } else if (arg == "--gamma_1" && i + 1 < argc) {
            try { p.gamma_1 = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --gamma_1\n"; return false; }
        } else if (arg == "--gamma_2" && i + 1 < argc) {
            try { p.gamma_2 = std::stof(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --gamma_2\n"; return false; }
        } else if (arg == "--pad" && i + 1 < argc) {
            config.pad_mode = argv[++i];
            if (config.pad_mode != "zero" && config.pad_mode != "reflect" && config.pad_mode != "none") {
                std::cerr << "Error: Invalid pad mode '" << config.pad_mode << "'. Must be 'zero', 'reflect' or 'none'.\n";
                return false;
            }
        } else if (arg == "--clip") {
            p.clip_output = true;
        } else {
            std::cerr << "Error: Unknown or invalid argument: " << arg << std::endl;
            printUsage(argv[0]);
            return false;
        }
    }
    if (config.input_image_path.empty()) {
        std::cerr << "Error: --input is required.\n";
        printUsage(argv[0]);
        return false;
    }
    try {
        cacorr::validate_parameters(p);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    if (config.output_image_path.empty()) {
        std::filesystem::path in(config.input_image_path);
        config.output_image_path = (in.parent_path() / (in.stem().string() + "_corrected.png")).string();
    }
    return true; // Indicate success
}

// --- Helper: Load Image as normalized float RGB ---
cv::Mat loadImage(const std::string& path) {
    cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR | cv::IMREAD_ANYDEPTH);
    if (bgr.empty()) {
        throw std::runtime_error("Cannot read image file: " + path);
    }

    double scale = 1.0;
    if (bgr.depth() == CV_8U) {
        scale = 1.0 / 255.0;
    } else if (bgr.depth() == CV_16U) {
        scale = 1.0 / 65535.0;
    } else if (bgr.depth() != CV_32F) {
        throw std::runtime_error("Unsupported image depth in file: " + path);
    }

    cv::Mat bgr_float;
    bgr.convertTo(bgr_float, CV_32F, scale);

    // OpenCV reads in BGR, convert to RGB for the correction
    cv::Mat rgb;
    cv::cvtColor(bgr_float, rgb, cv::COLOR_BGR2RGB);
    std::cout << "Loaded " << rgb.cols << "x" << rgb.rows << " image from " << path << std::endl;
    return rgb;
}

// --- Helper: Save float RGB image as 8-bit ---
void saveImage(const std::string& path, const cv::Mat& rgb) {
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

    // convertTo saturates to [0, 255]
    cv::Mat bgr_u8;
    bgr.convertTo(bgr_u8, CV_8U, 255.0);
    if (!cv::imwrite(path, bgr_u8)) {
        throw std::runtime_error("Could not write image file: " + path);
    }
    std::cout << "Image saved to " << path << std::endl;
}


int main(int argc, char* argv[]) {
    std::cout << "Chromatic Aberration Correction" << std::endl;
    std::cout << "Using OpenCV version: " << CV_VERSION << std::endl;

    Config config;
    if (!parseArgs(argc, argv, config)) {
        return (argc > 1 && std::string(argv[1]) == "--help") ? 0 : 1; // Exit code 0 for --help, 1 for error
    }

    const cacorr::FilterParameters& p = config.params;
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Input Image: " << config.input_image_path << std::endl;
    std::cout << "Output Image: " << config.output_image_path << std::endl;
    std::cout << "L_hor: " << p.L_hor << std::endl;
    std::cout << "L_ver: " << p.L_ver << std::endl;
    std::cout << "rho: [" << p.rho[0] << ", " << p.rho[1] << ", " << p.rho[2] << "]" << std::endl;
    std::cout << "tau: " << p.tau << std::endl;
    std::cout << "alpha_R: " << p.alpha_R << std::endl;
    std::cout << "alpha_B: " << p.alpha_B << std::endl;
    std::cout << "beta_R: " << p.beta_R << std::endl;
    std::cout << "beta_B: " << p.beta_B << std::endl;
    std::cout << "gamma_1: " << p.gamma_1 << std::endl;
    std::cout << "gamma_2: " << p.gamma_2 << std::endl;
    std::cout << "Padding: " << config.pad_mode << std::endl;
    std::cout << "Clip Output: " << (p.clip_output ? "yes" : "no") << std::endl;
    std::cout << "---------------------" << std::endl;

    try {
        cv::Mat image = loadImage(config.input_image_path);

        std::cout << "Start restoration..." << std::endl;
        auto start_time = std::chrono::high_resolution_clock::now();

        cv::Mat corrected;
        if (config.pad_mode == "none") {
            corrected = cacorr::correct_chromatic_aberration(image, p);
        } else {
            const int border = (config.pad_mode == "zero") ? cv::BORDER_CONSTANT : cv::BORDER_REFLECT_101;
            corrected = cacorr::correct_chromatic_aberration_padded(image, p, border);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        std::cout << "Elapsed time: " << duration.count() << " ms" << std::endl;

        double min_val = 0.0, max_val = 0.0;
        cv::minMaxLoc(corrected.reshape(1), &min_val, &max_val);
        std::cout << "Output range: [" << min_val << ", " << max_val << "]" << std::endl;

        saveImage(config.output_image_path, corrected);
    } catch (const std::exception& e) {
        std::cerr << "Error during processing: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Done!" << std::endl;
    return 0;
}
