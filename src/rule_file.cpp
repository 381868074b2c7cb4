// File: rule_file.cpp
#include "rule_file.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"
#include "virtual_path.hpp"

static const std::string g_defaultTemplate = R"(# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
# ~~~~~~~~~~~~~~~ rdfs sorting file ~~~~~~~~~~~~~~~
# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

# - write comment lines using "#"
#
# - write regex definitions using: "/foldername" + " == " + regex definition. You can edit the existing ones or create new ones.
#   Order matters for regex folders, first match will be final destination. Make sure there are no trailing space characters.
#   torrents that dont match any regex definition end up in a folder named "default".
#   Example: /movies == (?i)(19|20)([0-9]{2} ?\.?)
#
# - create new directories using "/foldername"
#   Example: /archive
#
# - write move/renaming changes using: "/" + "actual torrent title" + "/" + "file ID" + " -> " + "destination"
#   You do not need to create the directories you are moving stuff to, this will be done automatically.
#   Example: /some.show.S01/ -> /shows/some.show/season 1/
#   Example: /some.show.S01/ABCDEFGHIJKL -> /shows/some.show/season 1/episode 1.mkv

# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
# ~~~~~~~~~ top level and regex folders: ~~~~~~~~~~
# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

/shows == (?i)(S[0-9]{2}|SEASONS?.[0-9]|COMPLETE|[^457a-z\W\s]-[0-9]+)
/movies == (?i)(19|20)([0-9]{2} ?\.?)
/default

# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
# ~~~ recorded/manual changes to the structure: ~~~
# ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

)";

bool RegexRule::matches(const std::string &torrentName) const
{
    return boost::regex_search(torrentName, regex);
}

RuleLine RuleLine::Parse(const std::string &text)
{
    RuleLine line;
    if (text.empty() || text == "\r")
    {
        line.kind = RuleLineKind::Blank;
        return line;
    }
    if (text[0] == '#')
    {
        line.kind = RuleLineKind::Comment;
        return line;
    }

    // Move lines are checked first so a destination containing " == " stays a move
    auto movePos = text.find(kMoveSeparator);
    if (movePos != std::string::npos)
    {
        line.kind = RuleLineKind::Move;
        line.key = text.substr(0, movePos);
        line.value = text.substr(movePos + kMoveSeparator.size());
        return line;
    }

    auto regexPos = text.find(kRegexSeparator);
    if (regexPos != std::string::npos)
    {
        line.kind = RuleLineKind::Regex;
        line.key = text.substr(0, regexPos);
        line.value = text.substr(regexPos + kRegexSeparator.size());
        return line;
    }

    // A bare line declares a folder: "/archive" and "/archive/" both mean "/archive/"
    line.kind = RuleLineKind::Leaf;
    line.key = text;
    line.value = VirtualPath::Folder(text).str();
    return line;
}

RuleFile::RuleFile(std::string path, bool strictRules)
    : path_(std::move(path)), strictRules_(strictRules)
{
}

const std::string &RuleFile::DefaultTemplate()
{
    return g_defaultTemplate;
}

bool RuleFile::ensureExists()
{
    std::error_code ec;
    if (std::filesystem::exists(path_, ec))
        return false;

    Logger::Log(LogLevel::WARN, "RuleFile: no sorting file found - creating new sorting file at " + path_);

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    out << g_defaultTemplate;
    out.flush();
    if (!out.good())
    {
        throw RuleFileError("could not create sorting file " + path_);
    }
    return true;
}

std::vector<std::string> RuleFile::readLines() const
{
    std::ifstream in(path_);
    if (!in.is_open())
    {
        throw RuleFileError("could not open sorting file " + path_);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    if (in.bad())
    {
        throw RuleFileError("error while reading sorting file " + path_);
    }
    return lines;
}

ParsedRules RuleFile::Parse(const std::vector<std::string> &lines, bool strictRules)
{
    ParsedRules parsed;

    for (size_t i = 0; i < lines.size(); ++i)
    {
        RuleLine line = RuleLine::Parse(lines[i]);
        switch (line.kind)
        {
        case RuleLineKind::Blank:
        case RuleLineKind::Comment:
            break;
        case RuleLineKind::Move:
        case RuleLineKind::Leaf:
            parsed.mappings.emplace_back(line.key, line.value);
            break;
        case RuleLineKind::Regex:
        {
            RegexRule rule;
            rule.folder = line.key;
            rule.pattern = line.value;
            try
            {
                rule.regex = boost::regex(line.value, boost::regex::perl);
                parsed.regexRules.push_back(std::move(rule));
            }
            catch (const boost::regex_error &ex)
            {
                RuleWarning warning{i + 1, lines[i], ex.what()};
                if (strictRules)
                {
                    throw RuleFileError("invalid regex on line " + std::to_string(warning.lineNumber) + ": " + warning.message);
                }
                Logger::Log(LogLevel::WARN, "RuleFile: dropping rule on line " + std::to_string(warning.lineNumber) +
                                                " (" + warning.line + "): " + warning.message);
                parsed.warnings.push_back(std::move(warning));
            }
            break;
        }
        }
    }
    return parsed;
}

ParsedRules RuleFile::load() const
{
    Logger::Log(LogLevel::DEBUG, "RuleFile: reading sorting file " + path_);
    return Parse(readLines(), strictRules_);
}

void RuleFile::rewrite(const std::vector<std::string> &lines)
{
    std::string content;
    for (const auto &line : lines)
    {
        content += line;
        content += '\n';
    }

    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        throw RuleFileError("could not open sorting file for writing " + path_);
    }
    out << content;
    out.flush();
    if (!out.good())
    {
        throw RuleFileError("error while writing sorting file " + path_);
    }
}

void RuleFile::appendLine(const std::string &line)
{
    std::ofstream out(path_, std::ios::out | std::ios::app);
    if (!out.is_open())
    {
        throw RuleFileError("could not open sorting file for appending " + path_);
    }
    out << line << '\n';
    out.flush();
    if (!out.good())
    {
        throw RuleFileError("error while appending to sorting file " + path_);
    }
}

std::optional<std::filesystem::file_time_type> RuleFile::modifiedAt() const
{
    std::error_code ec;
    auto stamp = std::filesystem::last_write_time(path_, ec);
    if (ec)
        return std::nullopt;
    return stamp;
}
