#include "agentlink/json_util.hpp"
#include <memory>

namespace agentlink {

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && error) *error = errs;
    return ok;
}

} // namespace agentlink
