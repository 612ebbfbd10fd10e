#pragma once

#include <stdexcept>
#include <string>

namespace conjure {

// Internal fault raised by engine components. The controller converts every
// Error (and any other std::exception) into an error Outcome.
class Error : public std::runtime_error {
public:
    Error(std::string type, const std::string& message, std::string metadata_json = "{}");

    const std::string& type() const { return type_; }
    const std::string& metadata_json() const { return metadata_json_; }
    bool retriable() const;

private:
    std::string type_;
    std::string metadata_json_;
};

// Error types whose failures may succeed on a later attempt.
bool is_retriable_error_type(const std::string& type);

enum class FailureClass { NONE, EXTRINSIC, ADAPTIVE, INTRINSIC };

// Classification used by repair-vs-regenerate decisions and artifact counters.
FailureClass failure_class_for(const std::string& error_type);
const char* failure_class_name(FailureClass c);

} // namespace conjure
