#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "FidelityScorer.h"
#include "GenerationPipeline.h"
#include "RecordFileIO.h"
#include "ReferenceRepairer.h"
#include "ResultSerializer.h"
#include "SynthConfiguration.h"
#include "TreatmentEffectAnalyzer.h"
#include "VitalsException.h"
#include "VitalsJsonSerializer.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;
using namespace trialsynth;
using trialsynth::utils::TeeStream;

namespace {

void printUsage(const po::options_description& common) {
    std::cout << "trialsynth - synthetic clinical-trial vital signs\n\n";
    std::cout << "Usage: trialsynth <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  generate   Generate synthetic records from a reference file\n";
    std::cout << "  repair     Repair a reference file and report every fix\n";
    std::cout << "  score      Score synthetic records against a reference\n";
    std::cout << "  effect     Welch two-arm treatment-effect test at one visit\n";
    std::cout << "  validate   Audit a reference file without changing it\n\n";
    std::cout << common << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  trialsynth generate --reference ref.csv --n-per-arm 50 --effect=-5 --seed 123 --output syn.csv\n";
    std::cout << "  trialsynth score --reference ref.csv --synthetic syn.csv --k 5\n";
    std::cout << "  trialsynth effect --input syn.csv --visit \"Week 12\"\n";
}

// Writes json to the file named by --output, or to the log stream.
void emitJson(const std::string& json, const po::variables_map& vm, std::ostream& log) {
    if (vm.count("output")) {
        const std::string path = vm["output"].as<std::string>();
        ResultSerializer::writeToFile(json, path);
        log << "Wrote " << path << std::endl;
    } else {
        log << json << std::endl;
    }
}

std::string requireOption(const po::variables_map& vm, const std::string& name) {
    if (!vm.count(name)) {
        throw SchemaError("missing required option --" + name);
    }
    return vm[name].as<std::string>();
}

void applyGenerationOverrides(const po::variables_map& vm, GenerationSettings& settings) {
    if (vm.count("n-per-arm")) {
        settings.nPerArm = vm["n-per-arm"].as<std::size_t>();
    }
    if (vm.count("effect")) {
        settings.targetEffect = vm["effect"].as<double>();
    }
    if (vm.count("seed")) {
        settings.seed = vm["seed"].as<uint64_t>();
    }
    if (vm.count("method")) {
        settings.method = stringToMethod(vm["method"].as<std::string>());
    }
    if (vm.count("jitter")) {
        settings.jitterFraction = vm["jitter"].as<double>();
    }
    if (vm.count("endpoint")) {
        settings.endpointVisit = stringToVisit(vm["endpoint"].as<std::string>());
    }
    if (vm.count("onset")) {
        settings.effectOnset = stringToOnset(vm["onset"].as<std::string>());
    }
    if (vm.count("mode")) {
        settings.effectMode = stringToMode(vm["mode"].as<std::string>());
    }
}

void applyScoringOverrides(const po::variables_map& vm, ScoringSettings& settings) {
    if (vm.count("k")) {
        settings.k = vm["k"].as<std::size_t>();
    }
    if (vm.count("mask-fraction")) {
        settings.options.maskFraction = vm["mask-fraction"].as<double>();
    }
    if (vm.count("mask-seed")) {
        settings.options.maskSeed = vm["mask-seed"].as<uint64_t>();
    }
    if (vm.count("threads")) {
        settings.options.threads = vm["threads"].as<std::size_t>();
    }
}

int runGenerate(const po::variables_map& vm, SynthConfiguration& config, std::ostream& log) {
    applyGenerationOverrides(vm, config.getGenerationSettings());
    const GenerationRequest request = config.toGenerationRequest();

    VitalsRecordList reference;
    if (vm.count("reference")) {
        ReferenceDataset dataset = RecordFileIO::loadRepairedRecords(vm["reference"].as<std::string>());
        log << "Reference: " << dataset.size() << " records, "
            << dataset.getReport().size() << " repairs" << std::endl;
        reference = dataset.getRecords();
    } else if (request.getMethod() != GenerationMethod::Rules) {
        throw SchemaError("--reference is required for the " + methodToString(request.getMethod()) + " method");
    }

    GenerationPipeline pipeline(log);
    const GenerationResult result = pipeline.run(request, reference);

    if (vm.count("output")) {
        const std::string path = vm["output"].as<std::string>();
        RecordFileIO::saveRecords(result.records, path);
        log << "Wrote " << result.records.size() << " records to " << path << std::endl;
    }
    if (vm.count("result")) {
        ResultSerializer::writeToFile(ResultSerializer::generationResultToJson(result),
                                      vm["result"].as<std::string>());
    }

    log << "Seed used: " << result.seedUsed << std::endl;
    return 0;
}

int runRepair(const po::variables_map& vm, std::ostream& log) {
    const std::string input = requireOption(vm, "input");
    const ReferenceDataset dataset = RecordFileIO::loadRepairedRecords(input);

    log << "Repaired " << input << ": " << dataset.size() << " records, "
        << dataset.getReport().size() << " fixes" << std::endl;
    for (const auto& action : dataset.getReport()) {
        log << "   [ReferenceRepairer] " << repairKindToString(action.kind)
            << " subject=" << action.subjectId
            << (action.visit ? " visit=" + visitToString(*action.visit) : std::string())
            << (action.field.empty() ? std::string() : " field=" + action.field)
            << " " << action.before << " -> " << action.after << "\n";
    }

    if (vm.count("output")) {
        RecordFileIO::saveRecords(dataset.getRecords(), vm["output"].as<std::string>());
    }
    if (vm.count("report")) {
        ResultSerializer::writeToFile(VitalsJsonSerializer::repairReportToJson(dataset.getReport()),
                                      vm["report"].as<std::string>());
    }
    return 0;
}

int runScore(const po::variables_map& vm, SynthConfiguration& config, std::ostream& log) {
    applyScoringOverrides(vm, config.getScoringSettings());
    const ScoringSettings& scoring = config.getScoringSettings();

    const ReferenceDataset reference = RecordFileIO::loadRepairedRecords(requireOption(vm, "reference"));
    const ReferenceDataset synthetic = RecordFileIO::loadRepairedRecords(requireOption(vm, "synthetic"));

    FidelityScorer scorer(scoring.options);
    const QualityReport report = scorer.score(reference.getRecords(), synthetic.getRecords(), scoring.k);

    log << report.summary << std::endl;
    emitJson(ResultSerializer::qualityReportToJson(report), vm, log);
    return 0;
}

int runEffect(const po::variables_map& vm, std::ostream& log) {
    const ReferenceDataset dataset = RecordFileIO::loadRepairedRecords(requireOption(vm, "input"));

    const Visit visit = stringToVisit(vm["visit"].as<std::string>());
    const auto field = tryParseColumn(vm["field"].as<std::string>());
    if (!field) {
        throw SchemaError("unknown field '" + vm["field"].as<std::string>() + "'");
    }

    const TreatmentEffectResult result = TreatmentEffectAnalyzer::analyze(dataset.getRecords(), visit, *field);

    log << visitToString(visit) << " " << columnName(*field)
        << ": difference=" << result.difference
        << " p=" << result.pValue
        << " (" << result.clinicalRelevance << ")" << std::endl;
    emitJson(ResultSerializer::treatmentEffectToJson(result), vm, log);
    return 0;
}

int runValidate(const po::variables_map& vm, std::ostream& log) {
    const ValidationReport report = ReferenceRepairer::validate(RecordFileIO::loadRawRecords(requireOption(vm, "input")));

    log << report.getRecordCount() << " records, " << report.getIssues().size() << " issue(s)" << std::endl;
    emitJson(VitalsJsonSerializer::validationReportToJson(report), vm, log);
    return report.countBySeverity(IssueSeverity::Critical) == 0 ? 0 : 2;
}

} // namespace

int main(int argc, char **argv)
{
    po::options_description common("Common options");
    common.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("log", po::value<std::string>(), "Mirror console output to this file")
        ("output,o", po::value<std::string>(), "Output file (.json or .csv)");

    po::options_description inputs("Input options");
    inputs.add_options()
        ("input,i", po::value<std::string>(), "Record file for repair, effect and validate")
        ("reference,r", po::value<std::string>(), "Reference record file")
        ("synthetic,s", po::value<std::string>(), "Synthetic record file for score")
        ("report", po::value<std::string>(), "Repair report JSON output")
        ("result", po::value<std::string>(), "Generation result JSON output");

    po::options_description generation("Generation options");
    generation.add_options()
        ("n-per-arm,n", po::value<std::size_t>(), "Subjects per arm")
        ("effect,e", po::value<double>(), "Target Active - Placebo SystolicBP difference")
        ("seed", po::value<uint64_t>(), "Master seed (drawn automatically when absent)")
        ("method,m", po::value<std::string>(), "mvn, bootstrap or rules")
        ("jitter", po::value<double>(), "Bootstrap jitter fraction in [0, 1]")
        ("endpoint", po::value<std::string>(), "Endpoint visit (default Week 12)")
        ("onset", po::value<std::string>(), "endpoint-only or linear")
        ("mode", po::value<std::string>(), "additive or snap");

    po::options_description scoring("Scoring and analysis options");
    scoring.add_options()
        ("k", po::value<std::size_t>(), "Neighbours for K-NN imputation")
        ("mask-fraction", po::value<double>(), "Share of reference rows masked for K-NN")
        ("mask-seed", po::value<uint64_t>(), "Seed selecting the masked rows")
        ("threads", po::value<std::size_t>(), "K-NN worker threads")
        ("visit", po::value<std::string>()->default_value("Week 12"), "Visit analysed by effect")
        ("field", po::value<std::string>()->default_value("SystolicBP"), "Field analysed by effect");

    po::options_description all;
    all.add(common).add(inputs).add(generation).add(scoring);

    if (argc < 2) {
        printUsage(all);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage(all);
        return 0;
    }

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc - 1, argv + 1).options(all).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(all);
            return 0;
        }

        SynthConfiguration config = SynthConfiguration::createDefault();
        if (vm.count("config")) {
            const std::string configPath = vm["config"].as<std::string>();
            if (!config.loadFromFile(configPath)) {
                std::cerr << "Error: " << config.getLastError() << std::endl;
                return 1;
            }
        }

        std::ofstream logFile;
        std::unique_ptr<TeeStream> tee;
        if (vm.count("log")) {
            const std::string logPath = vm["log"].as<std::string>();
            logFile.open(logPath);
            if (!logFile.is_open()) {
                std::cerr << "Error: could not open log file " << logPath << std::endl;
                return 1;
            }
            tee = std::make_unique<TeeStream>(std::cout, logFile);
        }
        std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::cout;

        if (command == "generate") {
            return runGenerate(vm, config, log);
        }
        if (command == "repair") {
            return runRepair(vm, log);
        }
        if (command == "score") {
            return runScore(vm, config, log);
        }
        if (command == "effect") {
            return runEffect(vm, log);
        }
        if (command == "validate") {
            return runValidate(vm, log);
        }

        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(all);
        return 1;
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
