// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "GeneratorFactory.h"
#include "BootstrapGenerator.h"
#include "MvnGenerator.h"
#include "RuleBasedGenerator.h"
#include "VitalsException.h"

namespace trialsynth
{
  std::unique_ptr<IVitalsGenerator> GeneratorFactory::create(GenerationMethod method)
  {
    switch (method)
      {
      case GenerationMethod::Mvn:
	return std::make_unique<MvnGenerator>();
      case GenerationMethod::Bootstrap:
	return std::make_unique<BootstrapGenerator>();
      case GenerationMethod::Rules:
	return std::make_unique<RuleBasedGenerator>();
      }

    throw SchemaError("GeneratorFactory: unknown generation method");
  }
} // namespace trialsynth
