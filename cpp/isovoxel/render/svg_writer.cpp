#include "isovoxel/render/svg_writer.h"
#include "isovoxel/color/color_math.h"

#include <cctype>
#include <cstdio>

namespace isovoxel {

namespace {
    void appendNumber(std::string& out, float v) {
        char buf[32];
        const int n = std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(v));
        if (n > 0) out.append(buf, static_cast<std::size_t>(n));
    }

    void appendPoint(std::string& out, const char* cmd, const Point2& p) {
        out += cmd;
        out += ' ';
        appendNumber(out, p.x);
        out += ' ';
        appendNumber(out, p.y);
    }

    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::string writeSvg(const Scene& scene) {
    if (scene.empty()) {
        return "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 400 400\"></svg>";
    }

    const std::string strokeHex = toHex(scene.stroke.color);
    std::string out;
    out.reserve(128 + scene.faces.size() * 160);

    out += "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"";
    appendNumber(out, scene.viewport.x);
    out += ' ';
    appendNumber(out, scene.viewport.y);
    out += ' ';
    appendNumber(out, scene.viewport.width);
    out += ' ';
    appendNumber(out, scene.viewport.height);
    out += "\" preserveAspectRatio=\"xMidYMid meet\">\n  <g>\n";

    for (const Face& face : scene.faces) {
        out += "    <path d=\"";
        appendPoint(out, "M", face.polygon[0]);
        for (std::size_t i = 1; i < face.polygon.size(); ++i) {
            out += ' ';
            appendPoint(out, "L", face.polygon[i]);
        }
        out += " Z\" fill=\"";
        out += toHex(face.fill);
        out += "\" stroke=\"";
        out += strokeHex;
        out += "\" stroke-width=\"";
        appendNumber(out, scene.stroke.widthPx);
        out += "\"/>\n";
    }

    out += "  </g>\n</svg>";
    return out;
}

std::string optimizeSvg(std::string_view svg) {
    std::string collapsed;
    collapsed.reserve(svg.size());
    bool inSpace = false;
    for (const char c : svg) {
        if (isSpace(c)) {
            if (!inSpace) collapsed += ' ';
            inSpace = true;
            continue;
        }
        inSpace = false;
        collapsed += c;
    }

    // After collapsing, whitespace between tags is at most one space.
    std::string out;
    out.reserve(collapsed.size());
    for (std::size_t i = 0; i < collapsed.size(); ++i) {
        const char c = collapsed[i];
        if (c == ' ' && !out.empty() && out.back() == '>' && i + 1 < collapsed.size() && collapsed[i + 1] == '<') {
            continue;
        }
        out += c;
    }

    const std::size_t first = out.find_first_not_of(' ');
    if (first == std::string::npos) return std::string{};
    const std::size_t last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

} // namespace isovoxel
