#include "common/io_utils.hpp"
#include <unistd.h>
#include <fstream>
#include <system_error>

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout << content;
}

void append_line(const fs::path &path, const string &line) {
    ofstream fout(path.string(), ios::app);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for appending");
    fout << line << '\n';
}

void add_exec_permission(const fs::path &path) {
    fs::permissions(path,
                    fs::perms::group_exec | fs::perms::others_exec | fs::perms::owner_exec,
                    fs::perm_options::add);
}

bool is_executable_file(const fs::path &path) {
    return fs::is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

}  // namespace solbuild
