#include "metadataparser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace {

const std::regex GROUP_RE(R"(^\s*\[([^\]]+)\]\s*)");
const std::regex SEASON_EPISODE_RE(R"(\b[Ss](\d{1,2})\s?[Ee](\d{1,3})\b)");
const std::regex CROSS_EPISODE_RE(R"(\b(\d{1,2})x(\d{2,3})\b)");
const std::regex ABSOLUTE_EPISODE_RE(R"(\s-\s(\d{1,3})(?:v\d)?(?=\s|$|\[|\())");
const std::regex RESOLUTION_RE(R"(\b(\d{3,4})[pP]\b)");
const std::regex UHD_RE(R"(\b4[kK]\b)");
const std::regex YEAR_RE(R"(\b(19\d{2}|20\d{2})\b)");

std::string collapseWhitespace(const std::string& input) {
    std::string out;
    bool space = false;
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (space)
            out.push_back(' ');
        space = false;
        out.push_back(c);
    }
    return out;
}

std::string cleanTitle(std::string title) {
    for (char& c : title) {
        if (c == '[' || c == ']' || c == '(' || c == ')')
            c = ' ';
    }
    title = collapseWhitespace(title);
    while (!title.empty() && (title.back() == '-' || title.back() == ' '))
        title.pop_back();
    return title;
}

} // namespace

std::optional<MediaMetadata> FilenameMetadataParser::parse(const std::filesystem::path& path) const {
    std::string name = path.stem().string();
    MediaMetadata meta;

    std::smatch match;
    if (std::regex_search(name, match, GROUP_RE)) {
        meta.group = match[1].str();
        name = match.suffix().str();
    }

    std::replace(name.begin(), name.end(), '.', ' ');
    std::replace(name.begin(), name.end(), '_', ' ');

    // Earliest recognised token ends the title
    std::size_t titleEnd = name.size();
    auto markEnd = [&titleEnd](const std::smatch& m) {
        titleEnd = std::min(titleEnd, static_cast<std::size_t>(m.position(0)));
    };

    if (std::regex_search(name, match, SEASON_EPISODE_RE)) {
        meta.season = std::stoi(match[1].str());
        meta.episode = std::stoi(match[2].str());
        markEnd(match);
    } else if (std::regex_search(name, match, CROSS_EPISODE_RE)) {
        meta.season = std::stoi(match[1].str());
        meta.episode = std::stoi(match[2].str());
        markEnd(match);
    } else if (std::regex_search(name, match, ABSOLUTE_EPISODE_RE)) {
        meta.episode = std::stoi(match[1].str());
        markEnd(match);
    }

    if (std::regex_search(name, match, RESOLUTION_RE)) {
        meta.resolution = match[1].str() + "p";
        markEnd(match);
    } else if (std::regex_search(name, match, UHD_RE)) {
        meta.resolution = "2160p";
        markEnd(match);
    }

    if (std::regex_search(name, match, YEAR_RE) && match.position(0) > 0) {
        meta.year = std::stoi(match[1].str());
        markEnd(match);
    }

    meta.title = cleanTitle(name.substr(0, titleEnd));
    if (meta.title.empty())
        return std::nullopt;

    return meta;
}
