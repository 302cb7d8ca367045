#pragma once
#include "font_scaler.hpp"
#include "html.hpp"
#include "ranker.hpp"

#include <string>

inline const std::string kDefaultStylesheet =
    "http://cse.osu.edu/software/2231/web-sw2/assignments/projects/"
    "tag-cloud-generator/data/tagcloud.css";

struct RenderOptions {
    std::string stylesheet = kDefaultStylesheet;
    bool inlineStyle = false;
    bool escapeMarkup = true;
};

class Renderer {
public:
    static std::string render(const SelectedSubset& subset,
                              const std::string& title,
                              std::size_t shownCount,
                              const RenderOptions& options = RenderOptions())
    {
        auto text = [&](const std::string& s) {
            return options.escapeMarkup ? htmlEscape(s) : s;
        };

        std::string heading = "Top " + std::to_string(shownCount) + " words in " + text(title);

        std::string html = "<html><head><title>" + heading + "</title>";
        if (!options.stylesheet.empty()) {
            html += "<link href=\"" + text(options.stylesheet) +
                    "\" rel=\"stylesheet\" type=\"text/css\">";
        }
        if (options.inlineStyle) {
            html += renderStyle();
        }
        html += "</head>\n";

        html += "<body><h2>" + heading + "</h2><hr></hr>\n";
        html += "<div class=\"cdiv\">\n";
        html += "<p class=\"cbox\">\n";

        for (const auto& entry : subset.entries) {
            int font = FontScaler::fontSize(entry.count, subset.minCount, subset.maxCount);
            html += "<span style=\"cursor:default\" class=\"f" + std::to_string(font) +
                    "\" title=\"count: " + std::to_string(entry.count) + "\">" +
                    text(entry.word) + "</span>\n";
        }

        html += "</p></div></body></html>\n";
        return html;
    }

    // Font classes f11..f48 so the page renders without the external stylesheet.
    static std::string renderStyle()
    {
        std::string css = "<style>";
        for (int size = FontScaler::kMinFont; size <= FontScaler::kMaxFont; ++size) {
            css += ".f" + std::to_string(size) + "{font-size:" + std::to_string(size) + "px}";
        }
        css += "</style>";
        return css;
    }
};
