#include "manifest.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <fmt/core.h>

namespace
{
    // Column index of the first header name present, if any
    std::optional<std::size_t> findColumn(const std::vector<std::string> &header,
                                          std::initializer_list<const char *> names)
    {
        for (const char *name : names)
        {
            auto it = std::find(header.begin(), header.end(), name);
            if (it != header.end())
            {
                return static_cast<std::size_t>(it - header.begin());
            }
        }
        return std::nullopt;
    }

    std::string field(const std::vector<std::string> &row, std::size_t index)
    {
        return index < row.size() ? row[index] : std::string();
    }

    // <cctype> takes unsigned char values; UTF-8 bytes are negative as plain char
    bool isSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }
    bool isDigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](char ch) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        });
        return value;
    }

    std::string trim(const std::string &value)
    {
        auto first = std::find_if_not(value.begin(), value.end(), isSpace);
        auto last = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
        return first < last ? std::string(first, last) : std::string();
    }

    std::optional<std::uint64_t> parseSize(const std::string &text)
    {
        if (text.empty() || !std::all_of(text.begin(), text.end(), isDigit))
        {
            return std::nullopt; // "N/A" and friends
        }
        try
        {
            return static_cast<std::uint64_t>(std::stoull(text));
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }
}

std::vector<std::string> splitTsvLine(const std::string &line)
{
    std::vector<std::string> fields;
    std::string current;
    std::size_t end = line.size();
    if (end > 0 && line[end - 1] == '\r')
    {
        --end;
    }

    for (std::size_t i = 0; i < end; ++i)
    {
        if (line[i] == '\t')
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += line[i];
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::optional<std::string> unsafePathReason(const std::string &id, const std::string &filename)
{
    for (const std::string *part : {&id, &filename})
    {
        std::filesystem::path path(*part);
        if (path.has_root_path())
        {
            return fmt::format("'{}' is an absolute path", *part);
        }
        for (const auto &component : path)
        {
            if (component == "..")
            {
                return fmt::format("'{}' contains a '..' component", *part);
            }
        }
    }

    auto name = std::filesystem::path(filename).filename();
    if (name.empty() || name == ".")
    {
        return fmt::format("'{}' does not name a file", filename);
    }
    return std::nullopt;
}

std::string ManifestEntry::extension() const
{
    auto ext = std::filesystem::path(filename).extension().string();
    if (!ext.empty() && ext.front() == '.')
    {
        ext.erase(0, 1);
    }
    return toLower(ext);
}

ManifestLoadResult ManifestLoader::load(const std::filesystem::path &path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw ManifestError(fmt::format("Cannot open manifest: {}", path.string()));
    }

    std::string line;
    if (!std::getline(file, line) || trim(line).empty())
    {
        throw ManifestError(fmt::format("Manifest {} is empty or has no header row", path.string()));
    }

    auto header = splitTsvLine(line);
    for (auto &name : header)
    {
        name = toLower(trim(name));
    }

    auto idCol = findColumn(header, {"id", "uuid", "file_id"});
    auto nameCol = findColumn(header, {"filename", "file_name"});
    auto md5Col = findColumn(header, {"md5", "md5sum"});
    auto sizeCol = findColumn(header, {"size", "file_size"});

    if (!idCol || !nameCol || !md5Col)
    {
        throw ManifestError(fmt::format(
            "Manifest {} must have identifier (id/uuid/file_id), filename (filename/file_name) "
            "and checksum (md5/md5sum) columns",
            path.string()));
    }

    ManifestLoadResult result;
    std::size_t rowNumber = 0;

    while (std::getline(file, line))
    {
        if (trim(line).empty())
        {
            continue; // Blank lines are not rows
        }
        ++rowNumber;

        auto row = splitTsvLine(line);
        std::string id = trim(field(row, *idCol));
        std::string filename = trim(field(row, *nameCol));
        std::string checksum = toLower(trim(field(row, *md5Col)));

        if (id.empty() || filename.empty() || checksum.empty())
        {
            result.rejected.push_back({rowNumber, id, filename, checksum,
                                       fmt::format("Manifest row {} is missing id, filename or md5", rowNumber)});
            continue;
        }
        if (auto unsafe = unsafePathReason(id, filename))
        {
            result.rejected.push_back({rowNumber, id, filename, checksum,
                                       fmt::format("Manifest row {} is unsafe: {}", rowNumber, *unsafe)});
            continue;
        }

        ManifestEntry entry{std::move(id), std::move(filename), std::move(checksum), std::nullopt};
        if (sizeCol)
        {
            entry.size = parseSize(trim(field(row, *sizeCol)));
        }
        result.entries.push_back(std::move(entry));
    }

    return result;
}

std::vector<ManifestEntry> ManifestLoader::filterByExtension(std::vector<ManifestEntry> entries,
                                                             const std::set<std::string> &allowed,
                                                             std::vector<ManifestEntry> &dropped)
{
    if (allowed.empty())
    {
        return entries;
    }

    std::vector<ManifestEntry> kept;
    kept.reserve(entries.size());
    for (auto &entry : entries)
    {
        if (allowed.count(entry.extension()) > 0)
        {
            kept.push_back(std::move(entry));
        }
        else
        {
            dropped.push_back(std::move(entry));
        }
    }
    return kept;
}

void ManifestLoader::write(const std::filesystem::path &path,
                           const std::vector<ManifestEntry> &entries,
                           const std::vector<std::string> &states)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
    {
        throw ManifestError(fmt::format("Cannot open manifest for writing: {}", path.string()));
    }

    out << "id\tfilename\tmd5\tsize\tstate\n";
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        const auto &entry = entries[i];
        out << fmt::format("{}\t{}\t{}\t{}\t{}\n",
                           entry.id,
                           entry.filename,
                           entry.expectedChecksum,
                           entry.size ? std::to_string(*entry.size) : std::string("N/A"),
                           i < states.size() ? states[i] : std::string());
    }

    out.flush();
    if (!out)
    {
        throw ManifestError(fmt::format("Failed writing manifest: {}", path.string()));
    }
}
