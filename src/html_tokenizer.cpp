#include "diyanet/html_tokenizer.h"
#include "diyanet/errors.h"
#include "diyanet/logger.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <iterator>
#include <memory>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>

namespace diyanet {

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;

// Elements that never have content, and so never a real closing tag
const char* const VOID_ELEMENTS[] = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr",
};

bool is_void_element(const char* name) {
    return std::any_of(std::begin(VOID_ELEMENTS), std::end(VOID_ELEMENTS),
                       [name](const char* v) { return std::strcmp(v, name) == 0; });
}

const char* as_chars(const xmlChar* s) {
    return reinterpret_cast<const char*>(s);
}

struct LibXmlGlobal {
    LibXmlGlobal() { xmlInitParser(); }
};

void ensure_libxml_global() {
    static LibXmlGlobal global;
}

// Forwards libxml2 SAX callbacks to a MarkupHandler. Adjacent character
// callbacks are joined so the handler sees one text event per run.
class SaxBridge {
public:
    explicit SaxBridge(MarkupHandler& handler) : handler_(handler), ctxt_(nullptr) {}

    void attach(htmlParserCtxtPtr ctxt) { ctxt_ = ctxt; }

    bool failed() const { return static_cast<bool>(error_); }

    void rethrow_if_failed() const {
        if (error_) std::rethrow_exception(error_);
    }

    void finish() {
        guarded([this] { flush_text(); });
    }

    static void start_element(void* ctx, const xmlChar* name, const xmlChar** atts) {
        auto* self = static_cast<SaxBridge*>(ctx);
        self->guarded([self, name, atts] {
            self->flush_text();
            Attributes attrs;
            for (const xmlChar** p = atts; p && p[0]; p += 2) {
                attrs.emplace_back(as_chars(p[0]), p[1] ? as_chars(p[1]) : "");
            }
            self->handler_.on_start_tag(as_chars(name), attrs);
        });
    }

    static void end_element(void* ctx, const xmlChar* name) {
        auto* self = static_cast<SaxBridge*>(ctx);
        if (is_void_element(as_chars(name))) return;
        self->guarded([self, name] {
            self->flush_text();
            self->handler_.on_end_tag(as_chars(name));
        });
    }

    static void characters(void* ctx, const xmlChar* ch, int len) {
        auto* self = static_cast<SaxBridge*>(ctx);
        if (self->failed()) return;
        self->text_.append(as_chars(ch), static_cast<size_t>(len));
    }

    static void structured_error(void* ctx, xmlErrorPtr error) {
        (void)ctx;
        if (error && error->message) {
            Logger::instance().debugf("HTML parser: line %d: %s", error->line, error->message);
        }
    }

private:
    template <typename Fn>
    void guarded(Fn fn) {
        if (failed()) return;
        try {
            fn();
        } catch (...) {
            // carried across the C parser and rethrown by tokenize_html
            error_ = std::current_exception();
            if (ctxt_) xmlStopParser(ctxt_);
        }
    }

    void flush_text() {
        if (text_.empty()) return;
        std::string text;
        text.swap(text_);
        handler_.on_text(text);
    }

    MarkupHandler& handler_;
    htmlParserCtxtPtr ctxt_;
    std::string text_;
    std::exception_ptr error_;
};

} // namespace

const std::string* find_attribute(const Attributes& attrs, const std::string& name) {
    for (const auto& attr : attrs) {
        if (attr.first == name) return &attr.second;
    }
    return nullptr;
}

void tokenize_html(const std::string& html, MarkupHandler& handler) {
    ensure_libxml_global();

    htmlSAXHandler sax;
    std::memset(&sax, 0, sizeof(sax));
    sax.initialized = XML_SAX2_MAGIC;
    sax.startElement = &SaxBridge::start_element;
    sax.endElement = &SaxBridge::end_element;
    sax.characters = &SaxBridge::characters;
    sax.cdataBlock = &SaxBridge::characters;
    sax.ignorableWhitespace = &SaxBridge::characters;
    sax.serror = &SaxBridge::structured_error;

    SaxBridge bridge(handler);
    std::unique_ptr<htmlParserCtxt, decltype(&htmlFreeParserCtxt)> ctxt(
        htmlCreatePushParserCtxt(&sax, &bridge, nullptr, 0, nullptr, XML_CHAR_ENCODING_UTF8),
        &htmlFreeParserCtxt);
    if (!ctxt) {
        throw ParseError("Failed to create HTML parser context");
    }
    bridge.attach(ctxt.get());
    htmlCtxtUseOptions(ctxt.get(), HTML_PARSE_RECOVER | HTML_PARSE_NONET |
                                   HTML_PARSE_NOIMPLIED | HTML_PARSE_IGNORE_ENC);

    for (size_t offset = 0; offset < html.size() && !bridge.failed(); offset += CHUNK_SIZE) {
        size_t len = std::min(CHUNK_SIZE, html.size() - offset);
        htmlParseChunk(ctxt.get(), html.data() + offset, static_cast<int>(len), 0);
    }
    if (!bridge.failed()) {
        htmlParseChunk(ctxt.get(), nullptr, 0, 1);
    }
    bridge.finish();

    if (ctxt->myDoc) {
        xmlFreeDoc(ctxt->myDoc);
        ctxt->myDoc = nullptr;
    }
    bridge.rethrow_if_failed();
}

} // namespace diyanet
