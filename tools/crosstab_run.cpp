// crosstab_run — weighted survey crosstabs from data + definition sheets
//
// Usage:
//   crosstab_run --data <file> --survey <questions.csv> --options <options.csv>
//                --banner <banner.csv> --output <file.parquet|file.csv>
//                [--composites <composites.csv>] [--config <settings.txt>]
//                [--set key=value]... [--checkpoint <prefix>] [--report <file.json>]

#include "config/crosstab_config.hpp"
#include "diagnostics.hpp"
#include "io/crosstab_writer.hpp"
#include "io/parquet_checkpoint_store.hpp"
#include "io/report_json.hpp"
#include "io/sheet_readers.hpp"
#include "io/table_reader.hpp"
#include "runner/crosstab_runner.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --data <file> --survey <file> --options <file> --banner <file>"
                 " --output <path>\n"
              << "\n"
              << "  --data        Survey data (.csv or .parquet)\n"
              << "  --survey      Questions sheet (.csv)\n"
              << "  --options     Options sheet (.csv)\n"
              << "  --banner      Banner sheet (.csv)\n"
              << "  --composites  Composite metrics sheet (.csv, optional)\n"
              << "  --config      Settings file with key = value lines (optional)\n"
              << "  --set         Override one setting, key=value (repeatable)\n"
              << "  --checkpoint  Checkpoint file prefix (optional)\n"
              << "  --report      Write the run report as JSON (optional)\n"
              << "  --output      Output file path (.csv or .parquet)\n";
}

void print_error(const CrosstabError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    if (!e.why_it_matters().empty()) std::cerr << "  Impact: " << e.why_it_matters() << "\n";
    if (!e.how_to_fix().empty()) std::cerr << "  Fix: " << e.how_to_fix() << "\n";
}

void print_summary(const RunReport& report) {
    const Diagnostics& diag = report.diagnostics;
    for (const auto& i : diag.infos()) {
        std::cout << "  [" << i.source << "] " << i.message << "\n";
    }
    for (const auto& w : diag.warnings()) {
        std::cerr << "WARNING: [" << w.source << "] " << w.message << "\n";
    }
    for (const auto& t : diag.skipped_tests()) {
        std::cerr << "  SKIP: " << t.question << " / " << t.scope << ": " << t.reason << "\n";
    }
    auto skipped = report.skipped_questions();
    for (const auto& s : skipped) {
        std::cerr << "  SKIP: question " << s.code << ": " << s.reason << "\n";
    }

    std::cout << "\n=== Crosstab Summary ===\n";
    std::cout << "Status: " << run_status_str(report.status) << "\n";
    std::cout << "Tables: " << report.tables.size() << "\n";
    std::cout << "Banner columns: " << report.structure.size() << "\n";
    if (report.weighted) {
        std::cout << "Effective n: " << report.weights.effective_n
                  << " (design effect " << report.weights.design_effect << ")\n";
    }
    std::cout << "Warnings: " << diag.warnings().size() << "\n";
    std::cout << "Skipped tests: " << diag.skipped_tests().size() << "\n";
    std::cout << "Skipped questions: " << skipped.size() << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string data_path, survey_path, options_path, banner_path, composites_path;
    std::string config_path, checkpoint_prefix, report_path, output_path;
    std::vector<std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--survey" && i + 1 < argc) {
            survey_path = argv[++i];
        } else if (arg == "--options" && i + 1 < argc) {
            options_path = argv[++i];
        } else if (arg == "--banner" && i + 1 < argc) {
            banner_path = argv[++i];
        } else if (arg == "--composites" && i + 1 < argc) {
            composites_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--set" && i + 1 < argc) {
            overrides.push_back(argv[++i]);
        } else if (arg == "--checkpoint" && i + 1 < argc) {
            checkpoint_prefix = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            report_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    const std::vector<std::pair<const char*, const std::string*>> required = {
        {"--data", &data_path},     {"--survey", &survey_path}, {"--options", &options_path},
        {"--banner", &banner_path}, {"--output", &output_path},
    };
    for (const auto& [flag, value] : required) {
        if (value->empty()) {
            std::cerr << "Missing required argument: " << flag << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    bool use_parquet = false;
    {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    try {
        CrosstabConfig cfg = config_path.empty() ? CrosstabConfig{}
                                                 : config_io::load_settings_file(config_path);
        for (const auto& o : overrides) config_io::apply_assignment(cfg, o);

        std::cout << "Loading data: " << data_path << "\n";
        RespondentTable data = tab_io::read_table(data_path);
        std::cout << "  " << data.row_count() << " respondents, " << data.column_count()
                  << " columns\n";

        SurveyStructure survey = tab_io::read_survey_structure(survey_path, options_path);
        std::vector<BannerRequest> banner = tab_io::read_banner(banner_path);
        std::vector<CompositeDefinition> composites;
        if (!composites_path.empty()) composites = tab_io::read_composites(composites_path);
        std::cout << "  " << survey.questions().size() << " questions, " << banner.size()
                  << " banner questions, " << composites.size() << " composites\n\n";

        CrosstabRunner runner(cfg, survey, banner, composites);
        runner.set_progress_callback([](const QuestionOutcome& o) {
            std::cout << "  " << o.code << ": ";
            if (o.skipped) {
                std::cout << "skipped\n";
            } else if (!o.has_table) {
                std::cout << "no table\n";
            } else {
                std::cout << o.row_count << " rows\n";
            }
        });

        std::unique_ptr<CheckpointStore> store;
        if (!checkpoint_prefix.empty()) {
            store = std::make_unique<ParquetCheckpointStore>(checkpoint_prefix);
        }

        RunReport report = runner.run(data, store.get());

        if (use_parquet) {
            tab_io::write_crosstabs_parquet(report, cfg, output_path);
        } else {
            tab_io::write_crosstabs_csv(report, cfg, output_path);
        }
        if (!report_path.empty()) {
            std::ofstream out(report_path);
            if (!out.is_open()) {
                std::cerr << "ERROR: Cannot open " << report_path << "\n";
                return 1;
            }
            out << tab_io::report_to_json(report) << "\n";
        }

        print_summary(report);
        std::cout << "Output: " << output_path << "\n";
        return report.status == RunStatus::COMPLETE ? 0 : 2;
    } catch (const CrosstabError& e) {
        print_error(e);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
