#ifndef DOCREDACT_CORE_ERRORS_HPP
#define DOCREDACT_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

namespace docredact {
namespace core {

/*
  Error hierarchy
  --------------------------------
  Everything the engine throws derives from RedactionError, which is a
  std::runtime_error so callers that only know the standard hierarchy still
  catch it. Messages never contain a redacted literal.
*/

class RedactionError : public std::runtime_error
{
public:
    explicit RedactionError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

enum class InputErrorCode
{
    UnsupportedType,
    NotFound,
    TooLarge,
    OutputExists
};

inline std::string ToString(InputErrorCode code)
{
    switch (code) {
        case InputErrorCode::UnsupportedType: return "UnsupportedType";
        case InputErrorCode::NotFound:        return "NotFound";
        case InputErrorCode::TooLarge:        return "TooLarge";
        case InputErrorCode::OutputExists:    return "OutputExists";
    }
    return "Unknown";
}

class InputError : public RedactionError
{
public:
    InputError(InputErrorCode code, const std::string& msg)
        : RedactionError("InputError(" + ToString(code) + "): " + msg), m_code(code)
    {}

    InputErrorCode Code() const { return m_code; }

private:
    InputErrorCode m_code;
};

// The flat text view of a document could not be produced.
class ExtractionError : public RedactionError
{
public:
    explicit ExtractionError(const std::string& msg)
        : RedactionError("ExtractionError: " + msg)
    {}
};

// One page could not be analysed. Caught per page by LayoutAnalyzer.
class LayoutAnalysisError : public RedactionError
{
public:
    explicit LayoutAnalysisError(const std::string& msg)
        : RedactionError("LayoutAnalysisError: " + msg)
    {}
};

class AnalysisTimeout : public RedactionError
{
public:
    explicit AnalysisTimeout(const std::string& msg)
        : RedactionError("AnalysisTimeout: " + msg)
    {}
};

// Applying redactions failed; no partial output is produced.
class ApplicationError : public RedactionError
{
public:
    explicit ApplicationError(const std::string& msg)
        : RedactionError("ApplicationError: " + msg)
    {}
};

// -------------------------------------------------------------------------
// Accepted literals survived in the output. what() reports only the count;
// Surviving() gives the literals to the caller, who already knows them.
// -------------------------------------------------------------------------
class VerificationFailure : public RedactionError
{
public:
    explicit VerificationFailure(std::vector<std::string> surviving)
        : RedactionError("VerificationFailure: " + std::to_string(surviving.size())
                         + " accepted text(s) still present in output"),
          m_surviving(std::move(surviving))
    {}

    const std::vector<std::string>& Surviving() const { return m_surviving; }

private:
    std::vector<std::string> m_surviving;
};

class SessionError : public RedactionError
{
public:
    explicit SessionError(const std::string& msg)
        : RedactionError("SessionError: " + msg)
    {}
};

} // namespace core
} // namespace docredact

#endif // DOCREDACT_CORE_ERRORS_HPP
