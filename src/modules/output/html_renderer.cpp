#include "sbp/renderer.hpp"
#include "sbp/error.hpp"
#include <fstream>
#include <sstream>

namespace sbp {
namespace {
constexpr const char* kStyle =
    "body { font-family: sans-serif; max-width: 800px; margin: 0 auto; padding: 20px; }\n"
    ".scene { margin-bottom: 40px; border-bottom: 1px solid #ccc; padding-bottom: 20px; }\n"
    "img { max-width: 100%; height: auto; border: 1px solid #ddd; }\n"
    ".timestamp { color: #666; font-size: 0.9em; margin-bottom: 5px; }\n"
    ".captions { font-size: 1.1em; line-height: 1.5; margin-top: 10px; }\n"
    ".cue { margin: 0 0 0.4em 0; }\n";
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string render_html(const std::vector<SceneRecord>& records, const RenderOptions& opt) {
    const std::string title = html_escape(opt.title);
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
         << "<title>" << title << "</title>\n"
         << "<style>\n" << kStyle << "</style>\n"
         << "</head>\n"
         << "<body>\n"
         << "<h1>" << title << "</h1>\n";

    for (auto& rec : records) {
        const std::string when = format_hms(rec.scene.timestamp);
        html << "<div class=\"scene\" id=\"scene-" << rec.scene.index << "\" data-start-us=\""
             << rec.scene.timestamp.count() << "\">\n"
             << "  <div class=\"timestamp\">Time: " << when << "</div>\n"
             << "  <img src=\"" << html_escape(rec.scene.image_path) << "\" alt=\"Scene at " << when
             << "\">\n"
             << "  <div class=\"captions\">\n";
        for (auto& cue : rec.cues) {
            html << "    <p class=\"cue\" data-start-us=\"" << cue.start.count() << "\" data-end-us=\""
                 << cue.end.count() << "\">" << html_escape(cue.text) << "</p>\n";
        }
        html << "  </div>\n"
             << "</div>\n";
    }

    html << "</body>\n"
         << "</html>\n";
    return html.str();
}

std::filesystem::path write_document(const std::filesystem::path& dir, const std::string& name,
                                     const std::string& html) {
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw Error(ErrorKind::WriteError, "cannot open " + path.string());
    out << html;
    out.flush();
    if (!out.good()) throw Error(ErrorKind::WriteError, "short write to " + path.string());
    return path;
}
}
