#include "sbp/captions.hpp"
#include "sbp/error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace sbp {
namespace {
struct Line { std::size_t number; std::string text; };

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

std::string_view trim(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool starts_with_word(const std::string& s, std::string_view word) {
    if (s.compare(0, word.size(), word) != 0) return false;
    return s.size() == word.size() || s[word.size()] == ' ' || s[word.size()] == '\t';
}

// Header, comment and stylesheet blocks carry no cues.
bool is_meta_block(const std::vector<Line>& block, bool first) {
    const std::string& head = block.front().text;
    if (first && head.compare(0, 6, "WEBVTT") == 0) return true;
    return starts_with_word(head, "NOTE") || starts_with_word(head, "STYLE") ||
           starts_with_word(head, "REGION");
}

[[noreturn]] void fail(const std::string& source, std::size_t line, const std::string& what) {
    throw Error(ErrorKind::ParseError, source + ":" + std::to_string(line) + ": " + what);
}

Cue parse_block(const std::vector<Line>& block, const std::string& source) {
    std::size_t timing = block.size();
    for (std::size_t i = 0; i < block.size() && i < 2; ++i) {
        if (block[i].text.find("-->") != std::string::npos) { timing = i; break; }
    }
    if (timing == block.size()) fail(source, block.front().number, "cue block without a timing line");

    const Line& tl = block[timing];
    auto arrow = tl.text.find("-->");
    std::string_view left = trim(std::string_view(tl.text).substr(0, arrow));
    std::string_view right = trim(std::string_view(tl.text).substr(arrow + 3));
    right = right.substr(0, right.find_first_of(" \t"));  // drop cue settings

    Cue cue;
    try {
        cue.start = parse_timestamp(left);
        cue.end = parse_timestamp(right);
    } catch (const Error& e) {
        fail(source, tl.number, e.what());
    }
    if (cue.end < cue.start) fail(source, tl.number, "cue ends before it starts");

    std::string joined;
    for (std::size_t i = timing + 1; i < block.size(); ++i) {
        if (!joined.empty()) joined += ' ';
        joined += trim(block[i].text);
    }
    cue.text = clean_cue_text(joined);
    return cue;
}
}

std::string clean_cue_text(std::string_view raw) {
    std::string untagged;
    untagged.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        // Tags open with a name, a slash or a timestamp digit; a bare "<" is text.
        if (raw[i] == '<' && i + 1 < raw.size() &&
            (std::isalnum(static_cast<unsigned char>(raw[i + 1])) || raw[i + 1] == '/')) {
            auto close = raw.find('>', i);
            if (close != std::string_view::npos) { i = close; continue; }
        }
        untagged += raw[i];
    }

    static const std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&#39;", '\''}, {"&nbsp;", ' '},
    };
    std::string decoded;
    decoded.reserve(untagged.size());
    for (std::size_t i = 0; i < untagged.size(); ++i) {
        bool matched = false;
        if (untagged[i] == '&') {
            for (auto& [name, ch] : entities) {
                if (untagged.compare(i, name.size(), name) == 0) {
                    decoded += ch;
                    i += name.size() - 1;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) decoded += untagged[i];
    }

    std::string out;
    out.reserve(decoded.size());
    for (char c : decoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!out.empty() && out.back() != ' ') out += ' ';
        } else {
            out += c;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<Cue> parse_captions(std::istream& in, const std::string& source_name) {
    std::vector<std::vector<Line>> blocks;
    std::vector<Line> cur;
    std::string text;
    std::size_t number = 0;
    while (std::getline(in, text)) {
        ++number;
        if (!text.empty() && text.back() == '\r') text.pop_back();
        if (number == 1 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);
        if (is_blank(text)) {
            if (!cur.empty()) blocks.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back({number, text});
        }
    }
    if (!cur.empty()) blocks.push_back(std::move(cur));

    std::vector<Cue> cues;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (is_meta_block(blocks[i], i == 0)) {
            for (auto& l : blocks[i]) {
                if (l.text.find("-->") != std::string::npos)
                    fail(source_name, l.number, "cue timing inside a header or comment block");
            }
            continue;
        }
        Cue cue = parse_block(blocks[i], source_name);
        if (!cue.text.empty()) cues.push_back(std::move(cue));
    }
    std::stable_sort(cues.begin(), cues.end(),
                     [](const Cue& a, const Cue& b){ return a.start < b.start; });
    return cues;
}

std::vector<Cue> load_captions(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw Error(ErrorKind::InputNotFound, "cannot open captions: " + path.string());
    return parse_captions(f, path.string());
}
}
