#ifndef DOCREDACT_UTIL_CONFIG_PARSER_HPP
#define DOCREDACT_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <mutex>
#include "config/engine_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Minimal "key=value" parser populating docredact::config::EngineConfig.
 *
 * FORMAT:
 *   - One key=value per line, surrounding whitespace trimmed.
 *   - Lines starting with '#' and blank lines are skipped.
 *   - Unknown keys are logged and ignored; malformed values throw.
 *
 * USAGE:
 *   @code
 *   docredact::config::EngineConfig cfg;
 *   docredact::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("docredact.conf");
 *   @endcode
 */

namespace docredact {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates EngineConfig fields.
 */
class ConfigParser
{
public:
    /**
     * @param engineConfig The struct to populate. Must outlive the parser.
     */
    explicit ConfigParser(docredact::config::EngineConfig &engineConfig)
        : engineConfig_(engineConfig)
    {
    }

    /**
     * @brief Parse @p filepath line by line. A missing file keeps the defaults.
     * @throw std::runtime_error on malformed lines or values.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        parseStream(inFile, filepath);
        logger::info("[ConfigParser] Config loaded.");
    }

    /**
     * @brief Parse configuration text held in memory.
     */
    void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(text);
        parseStream(in, "<memory>");
    }

private:
    docredact::config::EngineConfig &engineConfig_;
    std::mutex mutex_;

    void parseStream(std::istream &in, const std::string &origin)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: " + origin + ":" + std::to_string(lineNo)
                                         + ": invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto &c = engineConfig_;
        if (key == "maxInputBytes") {
            c.maxInputBytes = parseUInt(key, val);
        }
        else if (key == "pdfRedactionPadding") {
            c.pdfRedactionPadding = parseNonNegativeDouble(key, val);
        }
        else if (key == "wordMergeTolerance") {
            c.wordMergeTolerance = parseNonNegativeDouble(key, val);
        }
        else if (key == "maxColumns") {
            uint64_t n = parseUInt(key, val);
            if (n < 1) {
                throw std::runtime_error("ConfigParser: maxColumns must be at least 1");
            }
            c.maxColumns = static_cast<uint32_t>(n);
        }
        else if (key == "readingZoneGap") {
            c.readingZoneGap = parseNonNegativeDouble(key, val);
        }
        else if (key == "blockVerticalGap") {
            c.blockVerticalGap = parseNonNegativeDouble(key, val);
        }
        else if (key == "blockHorizontalGap") {
            c.blockHorizontalGap = parseNonNegativeDouble(key, val);
        }
        else if (key == "clusterSeed") {
            c.clusterSeed = parseUInt(key, val);
        }
        else if (key == "layoutWorkerThreads") {
            c.layoutWorkerThreads = static_cast<uint32_t>(parseUInt(key, val));
        }
        else if (key == "layoutQueueCapacity") {
            c.layoutQueueCapacity = static_cast<uint32_t>(parseUInt(key, val));
        }
        else if (key == "analysisTimeoutMs") {
            c.analysisTimeoutMs = parseUInt(key, val);
        }
        else if (key == "textRedactionMarker") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: textRedactionMarker must not be empty");
            }
            c.textRedactionMarker = val;
        }
        else if (key == "docxFillerGlyph") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: docxFillerGlyph must not be empty");
            }
            c.docxFillerGlyph = val;
        }
        else if (key == "docxRedactionFont") {
            c.docxRedactionFont = val;
        }
        else if (key == "docxRedactionFontSize") {
            c.docxRedactionFontSize = static_cast<uint32_t>(parseUInt(key, val));
        }
        else if (key == "pdfOwnerPassword") {
            c.pdfOwnerPassword = val;
        }
        else if (key == "auditDatabasePath") {
            c.auditDatabasePath = val;
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val);
            c.logLevel = val;
        }
        else if (key == "logFile") {
            c.logFile = val;
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set");
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    static uint64_t parseUInt(const std::string &key, const std::string &val)
    {
        if (val.empty() || val[0] == '-') {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " parse failed on '" + val + "': " + ex.what());
        }
    }

    static double parseNonNegativeDouble(const std::string &key, const std::string &val)
    {
        errno = 0;
        char *end = nullptr;
        double d = std::strtod(val.c_str(), &end);
        if (val.empty() || end != val.c_str() + val.size() || errno == ERANGE || d < 0.0) {
            throw std::runtime_error("ConfigParser: " + key + " expects a non-negative number, got '" + val + "'");
        }
        return d;
    }
};

} // namespace util
} // namespace docredact

#endif // DOCREDACT_UTIL_CONFIG_PARSER_HPP
