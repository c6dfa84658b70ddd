#include "RecordFileIO.h"
#include "VitalsCsvReader.h"
#include "VitalsJsonSerializer.h"
#include <boost/algorithm/string.hpp>

namespace trialsynth {

bool RecordFileIO::isJsonPath(const std::string& path) {
    return boost::algorithm::iends_with(path, ".json");
}

RawVitalsRecordList RecordFileIO::loadRawRecords(const std::string& path) {
    if (isJsonPath(path)) {
        return VitalsJsonSerializer::loadRecordsFromFile(path);
    }

    VitalsCsvReader reader(path);
    return reader.readFile();
}

ReferenceDataset RecordFileIO::loadRepairedRecords(const std::string& path) {
    return ReferenceRepairer::repair(loadRawRecords(path));
}

void RecordFileIO::saveRecords(const VitalsRecordList& records, const std::string& path) {
    if (isJsonPath(path)) {
        VitalsJsonSerializer::saveRecordsToFile(records, path);
    } else {
        VitalsCsvWriter::writeFile(path, records);
    }
}

} // namespace trialsynth
