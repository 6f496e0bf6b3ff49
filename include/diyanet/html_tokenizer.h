#pragma once

#include <string>
#include <utility>
#include <vector>

namespace diyanet {

// Attribute names are lower-cased, values have character references decoded.
using Attributes = std::vector<std::pair<std::string, std::string>>;

// Returns nullptr when the attribute is absent.
const std::string* find_attribute(const Attributes& attrs, const std::string& name);

class MarkupHandler {
public:
    virtual ~MarkupHandler() = default;

    virtual void on_start_tag(const std::string& tag, const Attributes& attrs) = 0;
    virtual void on_text(const std::string& text) = 0;
    virtual void on_end_tag(const std::string& tag) = 0;
};

// Streams html through the libxml2 SAX parser in recovery mode. No tree is
// built: every start tag, end tag and run of text reaches the handler as soon
// as the parser reports it. Void elements (br, img, ...) produce no end tag.
// Exceptions thrown by the handler stop the parse and propagate.
void tokenize_html(const std::string& html, MarkupHandler& handler);

} // namespace diyanet
