// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_GENERATOR_FACTORY_H
#define __TRIALSYNTH_GENERATOR_FACTORY_H 1

#include <memory>
#include "IVitalsGenerator.h"

namespace trialsynth
{
  class GeneratorFactory
  {
  public:
    static std::unique_ptr<IVitalsGenerator> create(GenerationMethod method);

  private:
    GeneratorFactory() = delete;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_GENERATOR_FACTORY_H
