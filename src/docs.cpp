#include "docs.hpp"
#include <fmt/core.h>

namespace tristage {

namespace {

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

} // namespace

std::string generate_docs(std::string_view builder_name,
                          const std::vector<ModuleType>& types) {
    auto title = html_escape(builder_name);
    std::string html;
    html += "<!DOCTYPE html>\n<html>\n<head>\n";
    html += fmt::format("<title>{} module types</title>\n", title);
    html += "</head>\n<body>\n";
    html += fmt::format("<h1>{} module types</h1>\n", title);

    for (const auto& type : types) {
        html += fmt::format("<h2 id=\"{0}\">{0}</h2>\n", html_escape(type.name));
        if (!type.description.empty())
            html += fmt::format("<p>{}</p>\n", html_escape(type.description));
        if (type.properties.empty())
            continue;

        html += "<table>\n<tr><th>Property</th><th>Type</th><th>Description</th></tr>\n";
        for (const auto& prop : type.properties)
            html += fmt::format("<tr><td><code>{}</code></td><td>{}</td><td>{}</td></tr>\n",
                                html_escape(prop.name), html_escape(prop.type),
                                html_escape(prop.description));
        html += "</table>\n";
    }

    html += "</body>\n</html>\n";
    return html;
}

} // namespace tristage
