// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "TreatmentEffectInjector.h"
#include "ConstraintEnforcer.h"
#include "DescriptiveStats.h"

namespace trialsynth
{
  VitalsRecordList TreatmentEffectInjector::inject(const VitalsRecordList& records,
						   double targetEffect,
						   Visit endpointVisit,
						   EffectOnset onset,
						   EffectMode mode)
  {
    const double shift = computeShift(records, targetEffect, endpointVisit, mode);

    VitalsRecordList shifted(records);
    for (auto& record : shifted)
      {
	if (record.arm != TreatmentArm::Active)
	  continue;

	const double fraction = onsetFraction(record.visit, endpointVisit, onset);
	if (fraction > 0.0)
	  record.setValue(VitalsColumn::SystolicBP, record.systolicBP + fraction * shift);
      }

    return ConstraintEnforcer::enforce(shifted);
  }

  VitalsRecordList TreatmentEffectInjector::inject(const VitalsRecordList& records,
						   const GenerationRequest& request)
  {
    return inject(records,
		  request.getTargetEffect(),
		  request.getEndpointVisit(),
		  request.getEffectOnset(),
		  request.getEffectMode());
  }

  double TreatmentEffectInjector::onsetFraction(Visit visit, Visit endpointVisit, EffectOnset onset)
  {
    const std::size_t v = visitIndex(visit);
    const std::size_t endpoint = visitIndex(endpointVisit);

    if (onset == EffectOnset::EndpointOnly)
      return (v == endpoint) ? 1.0 : 0.0;

    if (v >= endpoint)
      return 1.0;

    return static_cast<double>(v) / static_cast<double>(endpoint);
  }

  double TreatmentEffectInjector::computeShift(const VitalsRecordList& records,
					       double targetEffect,
					       Visit endpointVisit,
					       EffectMode mode)
  {
    if (mode == EffectMode::Additive)
      return targetEffect;

    const auto active = columnValues(records, VitalsColumn::SystolicBP, endpointVisit, TreatmentArm::Active);
    const auto placebo = columnValues(records, VitalsColumn::SystolicBP, endpointVisit, TreatmentArm::Placebo);
    if (active.empty() || placebo.empty())
      return targetEffect;

    const double observed = DescriptiveStats::computeMean(active) - DescriptiveStats::computeMean(placebo);
    return targetEffect - observed;
  }
} // namespace trialsynth
