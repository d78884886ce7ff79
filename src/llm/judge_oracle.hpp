#ifndef JUDGE_ORACLE_HPP
#define JUDGE_ORACLE_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace llm {

// Judge could not be reached or answered with an error.
class JudgeError : public std::runtime_error {
public:
    explicit JudgeError(const std::string &what) : std::runtime_error(what) {}
};

// Judge answered but the reply does not contain a usable score array.
class JudgeParseError : public JudgeError {
public:
    explicit JudgeParseError(const std::string &what) : JudgeError(what) {}
};

// Scores candidate answers against a reference answer. On success the result
// has exactly one entry per candidate, in candidate order, each in [0,1].
class JudgeOracle {
public:
    virtual ~JudgeOracle() = default;

    virtual std::vector<double> score(const std::string &prompt,
                                      const std::string &reference,
                                      const std::vector<std::string> &candidates) = 0;
};

} // namespace llm

#endif // JUDGE_ORACLE_HPP
