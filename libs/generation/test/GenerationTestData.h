#pragma once

#include <string>
#include "VitalsRecord.h"

namespace trialsynth
{
  namespace testdata
  {
    // A clean reference with subjectsPerArm subjects per arm and all four visits each.
    inline VitalsRecordList referenceCohort(int subjectsPerArm = 10)
    {
      VitalsRecordList records;
      for (TreatmentArm arm : allArms())
        {
          for (int s = 0; s < subjectsPerArm; ++s)
            {
              const int i = static_cast<int>(armIndex(arm)) * subjectsPerArm + s;
              for (Visit visit : allVisits())
                {
                  const int v = static_cast<int>(visitIndex(visit));
                  VitalsRecord r;
                  r.subjectId = "REF-" + std::to_string(100 + i);
                  r.visit = visit;
                  r.arm = arm;
                  r.systolicBP = 120 + (i * 7) % 21 + v;
                  r.diastolicBP = 75 + (i * 5) % 11;
                  r.heartRate = 65 + (i * 3 + v) % 17;
                  r.temperature = 36.5 + 0.1 * ((i + v) % 6);
                  records.push_back(r);
                }
            }
        }
      return records;
    }
  }
}
