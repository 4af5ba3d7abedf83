#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * One transfer unit described by a manifest row.
 * Identity is the (id, filename) pair.
 */
struct ManifestEntry
{
    std::string id;
    std::string filename;
    std::string expectedChecksum; // lower-case hex, optionally "algo:hex"
    std::optional<std::uint64_t> size;

    /**
     * Lower-case extension of filename without the dot ("" if none).
     * "a.tar.gz" yields "gz".
     */
    std::string extension() const;

    // "<id>/<filename>", used as ledger key and remote object key
    std::string key() const { return id + "/" + filename; }
};

/**
 * A data row that could not be turned into a ManifestEntry.
 */
struct RejectedRow
{
    std::size_t rowNumber = 0; // 1-based, header excluded
    std::string id;            // whatever could be read, possibly empty
    std::string filename;
    std::string expectedChecksum;
    std::string reason;
};

struct ManifestLoadResult
{
    std::vector<ManifestEntry> entries;
    std::vector<RejectedRow> rejected;
};

/**
 * Reads tab-separated manifests.
 *
 * Recognized header names (first match wins):
 *   identifier: id, uuid, file_id
 *   filename:   filename, file_name
 *   checksum:   md5, md5sum
 *   size:       size, file_size   (optional)
 * Other columns, such as "state", are ignored.
 */
class ManifestLoader
{
public:
    /**
     * Parse a manifest file.
     *
     * @param path Manifest path
     * @return Parsed entries in file order plus rows that were skipped
     * @throws ManifestError if the file cannot be read or a required column is missing
     */
    static ManifestLoadResult load(const std::filesystem::path &path);

    /**
     * Split entries by extension allow-list. An empty allow-list keeps everything.
     *
     * @param entries Input entries (moved from)
     * @param allowed Lower-case extensions without dots
     * @param dropped Receives entries that were filtered out
     * @return Entries whose extension is allowed, order preserved
     */
    static std::vector<ManifestEntry> filterByExtension(std::vector<ManifestEntry> entries,
                                                        const std::set<std::string> &allowed,
                                                        std::vector<ManifestEntry> &dropped);

    /**
     * Write entries as a standard manifest (id, filename, md5, size, state).
     *
     * @param path Output path (overwritten)
     * @param entries Entries to write
     * @param states Per-entry value for the state column; may be empty
     * @throws ManifestError if the file cannot be written
     */
    static void write(const std::filesystem::path &path,
                      const std::vector<ManifestEntry> &entries,
                      const std::vector<std::string> &states = {});
};

/**
 * Split one line on tabs, stripping a trailing '\r'.
 */
std::vector<std::string> splitTsvLine(const std::string &line);

/**
 * Check that id and filename stay below the data directory when joined.
 * Absolute paths and ".." components are refused, and so is a filename
 * that does not end in a file name ("", ".", "dir/").
 *
 * @return Why the pair is unusable, or nullopt if it is safe
 */
std::optional<std::string> unsafePathReason(const std::string &id, const std::string &filename);
