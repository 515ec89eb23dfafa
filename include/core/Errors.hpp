#pragma once

#include <stdexcept>
#include <string>

namespace insights {

class InsightsError : public std::runtime_error {
public:
    explicit InsightsError(const std::string& message) : std::runtime_error(message) {}
};

// Unusable taxonomy or engine configuration. Fatal: raised before any run starts.
class ConfigurationError : public InsightsError {
public:
    explicit ConfigurationError(const std::string& message)
        : InsightsError("configuration error: " + message) {}
};

// A record without company, date or text. Caught per record and tallied.
class MalformedRecordError : public InsightsError {
public:
    MalformedRecordError(const std::string& record_id, const std::string& reason)
        : InsightsError("malformed record " + record_id + ": " + reason),
          m_record_id(record_id),
          m_reason(reason) {}

    const std::string& record_id() const { return m_record_id; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_record_id;
    std::string m_reason;
};

}  // namespace insights
