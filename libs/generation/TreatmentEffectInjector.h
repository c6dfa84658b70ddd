// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_TREATMENT_EFFECT_INJECTOR_H
#define __TRIALSYNTH_TREATMENT_EFFECT_INJECTOR_H 1

#include "GenerationRequest.h"
#include "VitalsRecord.h"

namespace trialsynth
{
  /**
   * @class TreatmentEffectInjector
   * @brief Shifts Active-arm SystolicBP so the arms differ by a target effect.
   *
   * The input is never modified; the shifted copy is passed through the
   * ConstraintEnforcer before it is returned, so clipping at the range bounds
   * can pull the realised effect below the target.
   */
  class TreatmentEffectInjector
  {
  public:
    static VitalsRecordList inject(const VitalsRecordList& records,
				   double targetEffect,
				   Visit endpointVisit = Visit::Week12,
				   EffectOnset onset = EffectOnset::EndpointOnly,
				   EffectMode mode = EffectMode::Additive);

    static VitalsRecordList inject(const VitalsRecordList& records, const GenerationRequest& request);

    /**
     * @brief Share of the full shift applied at a visit.
     *
     * EndpointOnly: 1 at the endpoint, 0 elsewhere. Linear:
     * visitIndex / endpointIndex up to the endpoint and 1 after it.
     */
    static double onsetFraction(Visit visit, Visit endpointVisit, EffectOnset onset);

    /**
     * @brief Full shift for Active SystolicBP. Additive returns targetEffect;
     * Snap returns targetEffect minus the current Active - Placebo mean
     * difference at the endpoint, or targetEffect when either arm has no
     * endpoint record.
     */
    static double computeShift(const VitalsRecordList& records,
			       double targetEffect,
			       Visit endpointVisit,
			       EffectMode mode);

  private:
    TreatmentEffectInjector() = delete;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_TREATMENT_EFFECT_INJECTOR_H
