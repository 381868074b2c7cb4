// File: rule_file.hpp
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/regex.hpp>

inline const std::string kMoveSeparator = " -> ";
inline const std::string kRegexSeparator = " == ";
inline const std::string kTrashMarker = ".trashed";

// Destination folder for torrents whose name matches pattern.
struct RegexRule
{
    std::string folder;
    std::string pattern;
    boost::regex regex;

    bool matches(const std::string &torrentName) const;
};

struct RuleWarning
{
    size_t lineNumber = 0;
    std::string line;
    std::string message;
};

enum class RuleLineKind
{
    Blank,
    Comment,
    Regex,
    Move,
    Leaf
};

struct RuleLine
{
    RuleLineKind kind = RuleLineKind::Blank;
    std::string key;
    std::string value;

    static RuleLine Parse(const std::string &text);
};

struct ParsedRules
{
    std::vector<RegexRule> regexRules;
    // In file order; a later line for the same key wins
    std::vector<std::pair<std::string, std::string>> mappings;
    std::vector<RuleWarning> warnings;
};

// The user-editable sorting file. Pure I/O: callers hold the rule-file lock.
class RuleFile
{
public:
    RuleFile(std::string path, bool strictRules = false);

    const std::string &path() const { return path_; }
    bool strictRules() const { return strictRules_; }

    // Writes the default template when the file is missing. Returns true when created.
    bool ensureExists();

    // Throws RuleFileError on I/O failure, or on a bad regex in strict mode.
    ParsedRules load() const;
    static ParsedRules Parse(const std::vector<std::string> &lines, bool strictRules);

    std::vector<std::string> readLines() const;

    // Replaces the whole file. The content is assembled before the file is truncated.
    void rewrite(const std::vector<std::string> &lines);
    void appendLine(const std::string &line);

    std::optional<std::filesystem::file_time_type> modifiedAt() const;

    static const std::string &DefaultTemplate();

private:
    std::string path_;
    bool strictRules_;
};
