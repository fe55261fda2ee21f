#include "multipart_decoder.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace upbeam::test {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

// Value of key="..." inside a header, backslash escapes resolved
std::string quotedParameter(std::string_view header, std::string_view key) {
    std::string needle = "; " + std::string(key) + "=\"";
    auto pos = header.find(needle);
    if (pos == std::string_view::npos) {
        return {};
    }
    std::string value;
    for (std::size_t i = pos + needle.size(); i < header.size(); ++i) {
        char c = header[i];
        if (c == '\\' && i + 1 < header.size()) {
            value.push_back(header[++i]);
        } else if (c == '"') {
            return value;
        } else {
            value.push_back(c);
        }
    }
    throw std::runtime_error("unterminated quoted parameter " + std::string(key));
}

} // namespace

std::string BoundaryFromContentType(std::string_view content_type) {
    auto pos = content_type.find("boundary=");
    if (pos == std::string_view::npos) {
        throw std::runtime_error("content type without boundary");
    }
    std::string_view value = content_type.substr(pos + 9);
    if (!value.empty() && value.front() == '"') {
        auto close = value.find('"', 1);
        if (close == std::string_view::npos) {
            throw std::runtime_error("unterminated quoted boundary");
        }
        return std::string(value.substr(1, close - 1));
    }
    return std::string(value.substr(0, value.find(';')));
}

std::vector<DecodedPart> DecodeMultipart(std::string_view body, std::string_view boundary) {
    const std::string first = "--" + std::string(boundary);
    const std::string delimiter = "\r\n--" + std::string(boundary);

    if (body.substr(0, first.size()) != first) {
        throw std::runtime_error("body does not start with the boundary");
    }

    std::vector<DecodedPart> parts;
    std::size_t pos = first.size();

    while (true) {
        std::string_view after = body.substr(pos);
        if (after.substr(0, 2) == "--") {
            if (after != "--\r\n" && after != "--") {
                throw std::runtime_error("trailing data after the closing delimiter");
            }
            return parts;
        }
        if (after.substr(0, 2) != "\r\n") {
            throw std::runtime_error("boundary line not terminated by CRLF");
        }
        pos += 2;

        auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            throw std::runtime_error("part headers not terminated");
        }

        DecodedPart part;
        std::string_view headers = body.substr(pos, headers_end - pos);
        while (!headers.empty()) {
            auto eol = headers.find("\r\n");
            std::string_view line = headers.substr(0, eol);
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                throw std::runtime_error("malformed part header line");
            }
            part.headers[lower(line.substr(0, colon))] = std::string(trim(line.substr(colon + 1)));
            headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + 2);
        }

        std::size_t content_begin = headers_end + 4;
        auto content_end = body.find(delimiter, content_begin);
        if (content_end == std::string_view::npos) {
            throw std::runtime_error("part without closing delimiter");
        }
        part.content = std::string(body.substr(content_begin, content_end - content_begin));

        const std::string& disposition = part.headers["content-disposition"];
        part.name = quotedParameter(disposition, "name");
        part.filename = quotedParameter(disposition, "filename");
        parts.push_back(std::move(part));

        pos = content_end + delimiter.size();
    }
}

} // namespace upbeam::test
