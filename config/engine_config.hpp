#ifndef DOCREDACT_CONFIG_ENGINE_CONFIG_HPP
#define DOCREDACT_CONFIG_ENGINE_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file engine_config.hpp
 * @brief Defines the tunable parameters of one redaction engine instance.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Geometry values are PDF points (1/72 inch).
 */

namespace docredact {
namespace config {

/**
 * @struct EngineConfig
 * @brief Holds the engine settings:
 *   - input limits (maxInputBytes)
 *   - layout analysis tolerances and clustering parameters
 *   - worker pool sizing and the analysis timeout
 *   - per-format redaction styling
 *   - audit and logging destinations
 */
struct EngineConfig
{
    /**
     * @brief Construct a new EngineConfig with the defaults:
     *   maxInputBytes = 100 MiB
     *   pdfRedactionPadding = 2pt, wordMergeTolerance = 2pt
     *   maxColumns = 3, readingZoneGap = 10pt
     *   blockVerticalGap = 5pt, blockHorizontalGap = 20pt
     *   clusterSeed = 42
     *   layoutWorkerThreads = 0 (hardware concurrency), layoutQueueCapacity = 64
     *   analysisTimeoutMs = 0 (unbounded)
     */
    EngineConfig()
        : maxInputBytes(100ULL * 1024ULL * 1024ULL),
          pdfRedactionPadding(2.0),
          wordMergeTolerance(2.0),
          maxColumns(3),
          readingZoneGap(10.0),
          blockVerticalGap(5.0),
          blockHorizontalGap(20.0),
          clusterSeed(42),
          layoutWorkerThreads(0),
          layoutQueueCapacity(64),
          analysisTimeoutMs(0),
          textRedactionMarker("[REDACTED]"),
          docxFillerGlyph("\xE2\x96\x88"),
          docxRedactionFont("Calibri"),
          docxRedactionFontSize(11),
          pdfOwnerPassword(),
          auditDatabasePath(),
          logLevel("INFO"),
          logFile()
    {
    }

    /// Hard ceiling on input file size, in bytes.
    uint64_t maxInputBytes;

    /// Padding added on every side of a PDF blackout mark.
    double pdfRedactionPadding;

    /// x/y tolerance used when merging fragmented PDF text boxes into words.
    double wordMergeTolerance;

    /// Upper bound for the number of detected columns per page.
    uint32_t maxColumns;

    /// Vertical gap that starts a new reading zone.
    double readingZoneGap;

    /// Maximum vertical gap between a word and the block it joins.
    double blockVerticalGap;

    /// Maximum horizontal gap between a word and the block it joins.
    double blockHorizontalGap;

    /// Seed for k-means++ initialisation; keeps column detection deterministic.
    uint64_t clusterSeed;

    /// Layout worker threads. Zero means std::thread::hardware_concurrency().
    uint32_t layoutWorkerThreads;

    /// Maximum number of queued page jobs before producers block.
    uint32_t layoutQueueCapacity;

    /// Deadline for layout analysis in milliseconds. Zero disables it.
    uint64_t analysisTimeoutMs;

    /// Replacement written over each redacted span in plain text.
    std::string textRedactionMarker;

    /// UTF-8 glyph repeated once per code point over a redacted DOCX span.
    std::string docxFillerGlyph;

    /// Font family applied to rewritten DOCX runs.
    std::string docxRedactionFont;

    /// Font size (points) applied to rewritten DOCX runs.
    uint32_t docxRedactionFontSize;

    /// Owner password for the encrypted PDF output. Empty means a random one per file.
    std::string pdfOwnerPassword;

    /// SQLite audit database. Empty disables auditing.
    std::string auditDatabasePath;

    /// Minimal log level name (DEBUG, INFO, WARN, ERROR, CRITICAL).
    std::string logLevel;

    /// Optional log file; console output is always on.
    std::string logFile;
};

} // namespace config
} // namespace docredact

#endif // DOCREDACT_CONFIG_ENGINE_CONFIG_HPP
