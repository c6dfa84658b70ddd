// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_VITALS_EXCEPTION_H
#define __TRIALSYNTH_VITALS_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace trialsynth
{
  class TrialSynthException : public std::runtime_error
  {
  public:
    explicit TrialSynthException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~TrialSynthException() = default;
  };

  // Malformed input: a required field is absent or holds an unknown value,
  // or a request combines options that cannot be used together.
  class SchemaError : public TrialSynthException
  {
  public:
    explicit SchemaError(const std::string& msg)
      : TrialSynthException("SchemaError: " + msg)
    {}
  };

  // Too few rows for covariance estimation, resampling, K-NN or a t-test.
  class InsufficientDataError : public TrialSynthException
  {
  public:
    explicit InsufficientDataError(const std::string& msg)
      : TrialSynthException("InsufficientDataError: " + msg)
    {}
  };

  // A clinical invariant is still broken after the constraint enforcer ran.
  // Reaching this means a logic defect, not bad input.
  class RangeViolationError : public TrialSynthException
  {
  public:
    explicit RangeViolationError(const std::string& msg)
      : TrialSynthException("RangeViolationError: " + msg)
    {}
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_VITALS_EXCEPTION_H
