#pragma once

#include <string>
#include "ReferenceRepairer.h"
#include "VitalsRecord.h"

namespace trialsynth {

/**
 * @brief File-level record I/O for the command line driver
 *
 * Paths ending in ".json" use the JSON encoding; anything else is CSV.
 */
class RecordFileIO {
public:
    static bool isJsonPath(const std::string& path);

    static RawVitalsRecordList loadRawRecords(const std::string& path);

    /**
     * @brief Loads and repairs a record file
     * @throws SchemaError, InsufficientDataError from the repairer
     */
    static ReferenceDataset loadRepairedRecords(const std::string& path);

    static void saveRecords(const VitalsRecordList& records, const std::string& path);
};

} // namespace trialsynth
