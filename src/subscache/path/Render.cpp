#include "path/Render.hpp"

#include "path/Numeric.hpp"
#include "path/PathBuffer.hpp"

namespace SC {

auto quote_subscript(std::string_view bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() + 2);
    bool inQuotes = false;
    bool inCodes  = false;
    for (char ch : bytes) {
        auto const code = static_cast<unsigned char>(ch);
        if (code >= 0x20 && code < 0x7f) {
            if (inCodes) {
                out.push_back(')');
                inCodes = false;
            }
            if (!inQuotes) {
                if (!out.empty()) {
                    out.push_back('_');
                }
                out.push_back('"');
                inQuotes = true;
            }
            if (ch == '"') {
                out.append("\"\"");
            } else {
                out.push_back(ch);
            }
            continue;
        }
        if (inQuotes) {
            out.push_back('"');
            inQuotes = false;
        }
        if (inCodes) {
            out.push_back(',');
        } else {
            if (!out.empty()) {
                out.push_back('_');
            }
            out.append("$C(");
            inCodes = true;
        }
        out.append(std::to_string(code));
    }
    if (inQuotes) {
        out.push_back('"');
    }
    if (inCodes) {
        out.push_back(')');
    }
    if (out.empty()) {
        out.assign("\"\"");
    }
    return out;
}

auto render_subscript(std::string_view bytes) -> std::string {
    if (is_canonical_number(bytes)) {
        return std::string{bytes};
    }
    return quote_subscript(bytes);
}

auto render(PathBuffer const& path, std::optional<std::size_t> depth) -> Expected<RenderedPath> {
    auto subscripts = path.subscripts();
    if (!subscripts) {
        return std::unexpected(subscripts.error());
    }
    auto const count = depth.value_or(subscripts->size());
    if (count > subscripts->size()) {
        return std::unexpected(Error{Error::Code::InvalidDepth,
                                     "Render depth " + std::to_string(count) + " is outside the range 0-"
                                         + std::to_string(subscripts->size())});
    }

    RenderedPath rendered{.varname = std::string{path.varname()}, .subscripts = {}};
    for (std::size_t index = 0; index < count; ++index) {
        if (index > 0) {
            rendered.subscripts.push_back(',');
        }
        rendered.subscripts.append(render_subscript((*subscripts)[index]));
    }
    return rendered;
}

auto to_string(PathBuffer const& path, std::optional<std::size_t> depth) -> Expected<std::string> {
    auto rendered = render(path, depth);
    if (!rendered) {
        return std::unexpected(rendered.error());
    }
    auto const count = depth.value_or(path.depth());
    if (count == 0) {
        return std::move(rendered->varname);
    }
    std::string text = std::move(rendered->varname);
    text.reserve(text.size() + rendered->subscripts.size() + 2);
    text.push_back('(');
    text.append(rendered->subscripts);
    text.push_back(')');
    return text;
}

} // namespace SC
