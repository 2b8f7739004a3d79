#include "../include/text_extractor.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cctype>
#include <cstdlib>
#include <unordered_set>

namespace {

// Appends text while collapsing whitespace: runs of blanks become one space,
// at most one blank line survives between paragraphs.
class TextSink {
public:
    void put(char c) {
        if (c == '\r') return;
        if (c == '\t' || c == ' ' || c == '\xa0') {
            if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n') out_.push_back(' ');
            return;
        }
        if (c == '\n') {
            while (!out_.empty() && out_.back() == ' ') out_.pop_back();
            if (out_.empty()) return;
            size_t nl = 0;
            for (auto it = out_.rbegin(); it != out_.rend() && *it == '\n'; ++it) ++nl;
            if (nl < 2) out_.push_back('\n');
            return;
        }
        out_.push_back(c);
    }
    void put(const std::string& s) { for (char c : s) put(c); }
    std::string& str() { return out_; }
    size_t size() const { return out_.size(); }

private:
    std::string out_;
};

std::string tag_name(const std::string& tag) {
    size_t i = 0;
    if (i < tag.size() && tag[i] == '/') ++i;
    std::string name;
    while (i < tag.size() && (std::isalnum(static_cast<unsigned char>(tag[i])) || tag[i] == ':')) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(tag[i]))));
        ++i;
    }
    return name;
}

bool is_page_break(const std::string& tag_lower, const std::string& name) {
    return name == "hr" ||
           tag_lower.find("page-break-before") != std::string::npos ||
           tag_lower.find("page-break-after") != std::string::npos ||
           tag_lower.find("break-before:page") != std::string::npos;
}

void close_page(ExtractedText& out, TextSink& sink, size_t& page_begin,
                const std::string& raw, size_t& raw_begin, size_t raw_end) {
    PageSpan p;
    p.number = static_cast<int>(out.pages.size()) + 1;
    p.begin = page_begin;
    p.end = sink.size();
    p.raw = raw.substr(raw_begin, raw_end - raw_begin);
    // A page with no text of its own is folded into the next one.
    if (p.end > p.begin) {
        out.pages.push_back(std::move(p));
        page_begin = sink.size();
        raw_begin = raw_end;
    }
}

}

std::string decode_html_entities(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') { out.push_back(s[i]); continue; }
        auto semi = s.find(';', i);
        if (semi == std::string::npos || semi - i > 10) { out.push_back('&'); continue; }
        std::string ent = s.substr(i + 1, semi - i - 1);
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent == "nbsp") rep = " ";
        else if (ent == "mdash" || ent == "ndash") rep = "-";
        else if (!ent.empty() && ent[0] == '#') {
            long cp = (ent.size() > 1 && (ent[1] == 'x' || ent[1] == 'X'))
                ? std::strtol(ent.c_str() + 2, nullptr, 16)
                : std::strtol(ent.c_str() + 1, nullptr, 10);
            if (cp == 160) rep = " ";
            else if (cp == 8211 || cp == 8212) rep = "-";
            else if (cp == 8217 || cp == 8216) rep = "'";
            else if (cp == 8220 || cp == 8221) rep = "\"";
            else if (cp > 0 && cp < 128) rep = std::string(1, static_cast<char>(cp));
            else rep = " ";
        } else {
            out.push_back('&');
            continue;
        }
        out += rep;
        i = semi;
    }
    return out;
}

ExtractedText extract_plain_text(const std::string& bytes) {
    ExtractedText out;
    TextSink sink;
    size_t page_begin = 0, raw_begin = 0;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] == '\f') {
            close_page(out, sink, page_begin, bytes, raw_begin, i);
            raw_begin = i + 1;
            continue;
        }
        sink.put(bytes[i]);
    }
    close_page(out, sink, page_begin, bytes, raw_begin, bytes.size());
    out.text = std::move(sink.str());
    return out;
}

ExtractedText extract_html_text(const std::string& html) {
    static const std::unordered_set<std::string> block = {
        "p", "div", "br", "tr", "li", "ul", "ol", "table", "h1", "h2", "h3", "h4", "h5", "h6",
        "section", "article", "center", "blockquote", "pre", "title"
    };
    static const std::unordered_set<std::string> skipped = {"script", "style", "head"};

    ExtractedText out;
    TextSink sink;
    size_t page_begin = 0, raw_begin = 0;
    std::string pending_text;
    std::string skip_until; // closing tag that ends a skipped element

    auto flush_text = [&]{
        if (!pending_text.empty()) {
            sink.put(decode_html_entities(pending_text));
            pending_text.clear();
        }
    };

    size_t i = 0;
    while (i < html.size()) {
        char c = html[i];
        if (c != '<') {
            if (skip_until.empty()) pending_text.push_back(c == '\n' ? ' ' : c);
            ++i;
            continue;
        }
        if (html.compare(i, 4, "<!--") == 0) {
            auto end = html.find("-->", i + 4);
            i = end == std::string::npos ? html.size() : end + 3;
            continue;
        }
        auto close = html.find('>', i);
        if (close == std::string::npos) break;
        std::string tag = html.substr(i + 1, close - i - 1);
        std::string name = tag_name(tag);
        bool closing = !tag.empty() && tag[0] == '/';
        size_t tag_start = i;
        i = close + 1;

        if (!skip_until.empty()) {
            if (closing && name == skip_until) skip_until.clear();
            continue;
        }
        if (!closing && skipped.count(name) && tag.back() != '/') {
            skip_until = name;
            continue;
        }
        flush_text();
        if (!closing && is_page_break(to_lower(tag), name)) {
            close_page(out, sink, page_begin, html, raw_begin, tag_start);
            continue;
        }
        if (block.count(name)) sink.put('\n');
        else if (name == "td" || name == "th") sink.put(closing ? ' ' : '\t');
    }
    flush_text();
    close_page(out, sink, page_begin, html, raw_begin, html.size());
    out.text = std::move(sink.str());
    return out;
}

ExtractedText extract_text(const RawDocument& doc) {
    auto ctype = to_lower(doc.content_type);
    if (ctype.find("pdf") != std::string::npos) {
        throw PipelineError(ErrorKind::ExtractionFailure, Stage::ExtractText,
                            doc.locator + ": PDF input is not supported; fetch the HTML rendition");
    }
    if (doc.bytes.find('\0') != std::string::npos) {
        throw PipelineError(ErrorKind::ExtractionFailure, Stage::ExtractText,
                            doc.locator + ": binary content (" + doc.content_type + ")");
    }
    bool html = ctype.find("html") != std::string::npos ||
                to_lower(doc.bytes.substr(0, 512)).find("<html") != std::string::npos;
    ExtractedText out = html ? extract_html_text(doc.bytes) : extract_plain_text(doc.bytes);
    if (trim(out.text).empty()) {
        throw PipelineError(ErrorKind::ExtractionFailure, Stage::ExtractText,
                            doc.locator + ": no text could be extracted");
    }
    return out;
}
