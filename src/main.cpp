#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "backend/languages.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "service.hpp"
using namespace std;
using namespace nlohmann;

static string read_source(const string &source) {
    if (source == "-") return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return sandbox::read_file_content(source);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("sandbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("language", po::value<string>(), "language of the source code, see --list-languages")
        ("source", po::value<string>(), "path to the source code, or - to read it from standard input")
        ("stdin", po::value<string>(), "path to the file fed to the program as standard input")
        ("challenge", po::value<string>(), "grade the source code against the hidden tests of the given challenge instead of running it")
        ("identity", po::value<string>()->default_value("anonymous"), "identity of the user submitting the code, used to detect first solves")
        ("solved", po::value<vector<string>>(), "challenge already solved by the user, can be given multiple times")
        ("list-languages", "list supported languages")
        ("list-challenges", "list challenges, filtered by --difficulty, --category, --search and --interview")
        ("difficulty", po::value<string>(), "only list challenges with given difficulty")
        ("category", po::value<string>(), "only list challenges in given category")
        ("search", po::value<string>(), "only list challenges whose title, category or tags contain given text")
        ("interview", po::value<bool>(), "only list challenges which are (true) or are not (false) interview questions")
        ("show-challenge", po::value<string>(), "display the statement of given challenge")
        ("challenges", po::value<string>(), "set the challenge catalog file. You can either pass it from environ CHALLENGES")
        ("run-dir", po::value<string>(), "set the directory to create workspaces for user programs in. You can either pass it from environ RUNDIR")
        ("output-limit", po::value<size_t>(), "set the maximum number of characters kept from stdout and stderr, default to 8000. You can either pass it from environ OUTPUTLIMIT")
        ("source-limit", po::value<size_t>(), "set the maximum number of bytes of accepted source code, default to 20000. You can either pass it from environ SOURCELIMIT")
        ("debug", "turn on the debug mode to log executed command lines and generated harnesses.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "sandbox: Run untrusted code or grade it against hidden tests" << endl
             << "Results are printed to standard output as JSON" << endl
             << "Usage: " << argv[0] << " --language <lang> --source <file> [--stdin <file>] [--challenge <id>]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        sandbox::DEBUG = true;
    } else if (getenv("DEBUG")) {
        sandbox::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        sandbox::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        sandbox::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    CHECK(filesystem::is_directory(sandbox::RUN_DIR))
        << "Run directory " << sandbox::RUN_DIR << " does not exist";

    if (vm.count("output-limit")) {
        sandbox::OUTPUT_LIMIT = vm["output-limit"].as<size_t>();
    } else if (getenv("OUTPUTLIMIT")) {
        sandbox::OUTPUT_LIMIT = boost::lexical_cast<size_t>(getenv("OUTPUTLIMIT"));
    }

    if (vm.count("source-limit")) {
        sandbox::SOURCE_LIMIT = vm["source-limit"].as<size_t>();
    } else if (getenv("SOURCELIMIT")) {
        sandbox::SOURCE_LIMIT = boost::lexical_cast<size_t>(getenv("SOURCELIMIT"));
    }

    filesystem::path challenges_path = repo_dir / "data" / "challenges.json";
    if (vm.count("challenges")) {
        challenges_path = filesystem::path(vm.at("challenges").as<string>());
    } else if (getenv("CHALLENGES")) {
        challenges_path = filesystem::path(getenv("CHALLENGES"));
    }
    CHECK(filesystem::is_regular_file(challenges_path))
        << "Challenge catalog " << challenges_path << " does not exist";

    python_runtime python(argv[0]);

    try {
        sandbox::challenge_catalog catalog = sandbox::challenge_catalog::load(challenges_path);
        sandbox::security_gate gate(sandbox::default_security_rules());
        sandbox::backend_registry registry;
        sandbox::register_default_backends(registry);
        sandbox::sandbox_service service(gate, registry, catalog);

        if (vm.count("list-languages")) {
            cout << json(service.languages()).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("list-challenges")) {
            sandbox::challenge_filter filter;
            if (vm.count("difficulty")) filter.difficulty = vm["difficulty"].as<string>();
            if (vm.count("category")) filter.category = vm["category"].as<string>();
            if (vm.count("search")) filter.search = vm["search"].as<string>();
            if (vm.count("interview")) filter.interview = vm["interview"].as<bool>();
            cout << catalog.summaries(filter).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("show-challenge")) {
            cout << catalog.detail(vm["show-challenge"].as<string>()).dump(2) << endl;
            return EXIT_SUCCESS;
        }

        if (!vm.count("language") || !vm.count("source")) {
            cerr << "--language and --source are required to run or grade code" << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }

        string language = vm["language"].as<string>();
        string source = read_source(vm["source"].as<string>());

        if (vm.count("challenge")) {
            string identity = vm["identity"].as<string>();
            if (vm.count("solved"))
                for (auto &id : vm["solved"].as<vector<string>>())
                    service.mark_solved(identity, id);
            service.on_first_solve([](const sandbox::first_solve_event &event) {
                LOG(INFO) << "User " << event.identity << " solved " << event.challenge_id << " for the first time";
            });

            sandbox::grading_result result = service.grade(identity, language, source, vm["challenge"].as<string>());
            cout << json(result).dump(2) << endl;
        } else {
            sandbox::execution_request request;
            request.language = language;
            request.source = source;
            if (vm.count("stdin")) request.stdin_text = sandbox::read_file_content(vm["stdin"].as<string>());

            json result = service.run(request);
            result["language"] = language;
            cout << result.dump(2) << endl;
        }
    } catch (sandbox::challenge_not_found &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (exception &ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
