#include "../include/config.hpp"
#include "../include/tag_cloud.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

Config loadConfig()
{
    Config cfg;
    if (cfg.load("config/settings.ini")) return cfg;
    if (cfg.load("../config/settings.ini")) return cfg;
    std::cout << "[Generator] No config/settings.ini found, using defaults\n";
    return cfg;
}

std::string prompt(const std::string& question)
{
    std::cout << question;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        throw std::runtime_error("Input closed while waiting for an answer");
    }
    return Config::trim(answer);
}

// Lines are joined with a trailing space each, so words never run across lines.
std::string readDocument(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Unable to find the file " + path);
    }

    std::string text;
    std::string line;
    while (std::getline(in, line)) {
        text += line;
        text += ' ';
    }
    if (in.bad()) {
        throw std::runtime_error("Error reading in the file " + path);
    }
    return text;
}

void writeDocument(const fs::path& path, const std::string& html)
{
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << html;
    out.flush();
    if (!out) {
        throw std::runtime_error("Error writing " + path.string());
    }
}

int askCount(const Config& cfg)
{
    int fallback = cfg.getInt("generator.default_count", -1);
    std::string question = "How many words would like to see in the Tag Cloud Generator? ";
    while (true) {
        std::string answer = prompt(question);
        if (answer.empty() && fallback >= 0) return fallback;
        try {
            return TagCloud::parseCount(answer);
        } catch (const InvalidCountError&) {
            question = "Sorry please enter a positive integer. ";
        } catch (const std::invalid_argument&) {
            std::cerr << "[Generator] Error: " << answer << " is not a valid number.\n";
        }
    }
}

int main(int argc, char** argv)
{
    try {
        Config cfg = loadConfig();

        std::string input = argc > 1 ? argv[1] : prompt("Please enter your file name: ");
        std::string text = readDocument(input);

        int count = argc > 2 ? TagCloud::parseCount(argv[2]) : askCount(cfg);

        fs::path output;
        if (argc > 3) {
            output = argv[3];
        } else {
            std::string htmlFile = prompt("Please enter the HTML file to write to. ");
            std::string folder = prompt("Please enter the folder to write to. ");
            output = folder.empty() ? fs::path(htmlFile) : fs::path(folder) / htmlFile;
        }

        SeparatorSet separators = TagCloud::separatorsFrom(cfg);
        RenderOptions options = TagCloud::renderOptionsFrom(cfg);

        TagCloudResult cloud = TagCloud::generate(text, input, count, separators, options);
        writeDocument(output, cloud.html);

        std::cout << "[Generator] " << input << ": " << cloud.distinctWords << " distinct words, showing "
                  << cloud.shownCount << " (counts " << cloud.minCount << ".." << cloud.maxCount << ")\n";
        std::cout << "[Generator] Wrote " << output.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[Generator] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
