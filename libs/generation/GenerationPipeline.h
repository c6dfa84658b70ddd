// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_GENERATION_PIPELINE_H
#define __TRIALSYNTH_GENERATION_PIPELINE_H 1

#include <cstdint>
#include <ostream>
#include "GenerationRequest.h"
#include "ReferenceRepairer.h"
#include "VitalsRecord.h"

namespace trialsynth
{
  struct GenerationResult
  {
    VitalsRecordList records;
    uint64_t seedUsed = 0;
    GenerationMethod method = GenerationMethod::Mvn;
  };

  /**
   * @class GenerationPipeline
   * @brief request -> strategy -> enforce -> inject -> enforce -> verify.
   *
   * When the request carries no seed a fresh one is drawn and reported in the
   * result, so every run can be replayed. Progress lines go to the stream
   * given at construction.
   */
  class GenerationPipeline
  {
  public:
    explicit GenerationPipeline(std::ostream& log);

    /**
     * @throws InsufficientDataError when the strategy lacks reference data
     * @throws RangeViolationError if a generated record breaks an invariant
     */
    GenerationResult run(const GenerationRequest& request, const VitalsRecordList& reference) const;

    GenerationResult run(const GenerationRequest& request, const ReferenceDataset& reference) const
    {
      return run(request, reference.getRecords());
    }

  private:
    std::ostream& mLog;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_GENERATION_PIPELINE_H
