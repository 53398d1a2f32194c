#include <glog/logging.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <iostream>
#include "build/orchestrator.hpp"
#include "common/exceptions.hpp"
#include "common/process.hpp"
#include "config.hpp"
#include "env.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("solbuild options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("solution", po::value<vector<string>>(), "path of the solution source file")
        ("public,p", "compile with the public grader instead of the judge grader")
        ("verbose,v", "print informational logs of each build step")
        ("help,h", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("solution", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return solbuild::E_ARGUMENT_ERROR;
    }

    if (vm.count("help")) {
        cout << "solbuild: Compile a solution of a task into the sandbox" << endl
             << "Required Environment Variables:" << endl
             << "\tPROBLEM_NAME: name of the task, unless BASE_DIR/problem.json gives it" << endl
             << "\tSANDBOX: directory to put the build products in" << endl
             << "\tTEMPLATES: directory of exec.*.sh and run.*.sh templates" << endl
             << "Usage: " << argv[0] << " [options] <solution-file>" << endl;
        cout << desc << endl;
        return solbuild::E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "solbuild 1.0" << endl;
        return solbuild::E_SUCCESS;
    }

    solbuild::build_request request;
    request.verbose = vm.count("verbose") > 0;
    request.use_public_grader = vm.count("public") > 0;
    FLAGS_minloglevel = request.verbose ? google::GLOG_INFO : google::GLOG_WARNING;

    try {
        vector<string> solutions;
        if (vm.count("solution")) solutions = vm["solution"].as<vector<string>>();
        if (solutions.empty())
            throw solbuild::argument_error("Solution file is not specified.");
        if (solutions.size() > 1)
            throw solbuild::argument_error("Only one solution file can be compiled at a time.");
        request.solution = solutions.front();

        solbuild::build_config config = solbuild::load_config(solbuild::current_environment());
        config.color_diagnostics = isatty(STDERR_FILENO);

        solbuild::system_process_runner runner;
        solbuild::orchestrator(config, runner).build(request);
    } catch (solbuild::build_exception& ex) {
        LOG(INFO) << ex;
        cerr << "Error: " << ex.what() << endl;
        return ex.exit_code();
    } catch (std::exception& ex) {
        cerr << "Error: " << ex.what() << endl;
        return solbuild::E_CONFIGURATION_ERROR;
    }

    cerr << "OK" << endl;
    return solbuild::E_SUCCESS;
}
