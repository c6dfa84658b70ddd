// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "BootstrapGenerator.h"
#include "DescriptiveStats.h"
#include "RngUtils.h"
#include "VitalsException.h"

namespace trialsynth
{
  namespace
  {
    struct BootstrapStratum
    {
      std::vector<VitalsSample> rows;
      VitalsSample jitterStdDev;
    };

    class ResamplingSampler : public IStratumSampler
    {
    public:
      explicit ResamplingSampler(std::array<BootstrapStratum, kNumStrata> strata)
	: mStrata(std::move(strata))
      {}

      VitalsSample draw(Visit visit, TreatmentArm arm, GeneratorEngine& engine) const override
      {
	const BootstrapStratum& stratum = mStrata[stratumIndex(visit, arm)];
	VitalsSample sample = stratum.rows[rng_utils::get_random_index(engine, stratum.rows.size())];

	for (std::size_t c = 0; c < kNumNumericColumns; ++c)
	  sample[c] = rng_utils::get_random_normal(engine, sample[c], stratum.jitterStdDev[c]);

	return sample;
      }

    private:
      std::array<BootstrapStratum, kNumStrata> mStrata;
    };
  }

  std::unique_ptr<IStratumSampler>
  BootstrapGenerator::createSampler(const GenerationRequest& request,
				    const VitalsRecordList& reference) const
  {
    if (reference.empty())
      throw InsufficientDataError("bootstrap generation needs a non-empty reference dataset");

    const double jitterFraction = request.getJitterFraction();
    std::array<BootstrapStratum, kNumStrata> strata;

    for (Visit visit : allVisits())
      {
	for (TreatmentArm arm : allArms())
	  {
	    VitalsRecordList rows = stratumRecords(reference, visit, arm);
	    if (rows.empty())
	      throw InsufficientDataError("bootstrap stratum " + visitToString(visit) + "/" +
					  armToString(arm) + " has no reference rows");

	    BootstrapStratum& stratum = strata[stratumIndex(visit, arm)];
	    stratum.rows.reserve(rows.size());
	    for (const auto& record : rows)
	      {
		VitalsSample row;
		for (VitalsColumn column : numericColumns())
		  row[columnIndex(column)] = record.getValue(column);
		stratum.rows.push_back(row);
	      }

	    for (VitalsColumn column : numericColumns())
	      stratum.jitterStdDev[columnIndex(column)] =
		jitterFraction * DescriptiveStats::computeSampleStdDev(columnValues(rows, column));
	  }
      }

    return std::make_unique<ResamplingSampler>(std::move(strata));
  }
} // namespace trialsynth
