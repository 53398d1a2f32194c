#include "build/language.hpp"
#include "common/exceptions.hpp"

namespace solbuild {
using namespace std;

language resolve_language(const filesystem::path &solution) {
    string ext = solution.extension().string();
    if (!ext.empty()) ext = ext.substr(1);

    if (ext == "cpp" || ext == "cc")
        return language::CPP;
    else if (ext == "pas")
        return language::PAS;
    else if (ext == "java")
        return language::JAVA;
    else if (ext == "py")
        return language::PY;
    else if (ext == "py2")
        return language::PY2;
    else
        throw unsupported_language_error(ext);
}

string language_tag(language lang) {
    switch (lang) {
        case language::CPP: return "cpp";
        case language::PAS: return "pas";
        case language::JAVA: return "java";
        case language::PY: return "py";
        case language::PY2: return "py2";
    }
    throw illegal_state_error("unknown language");
}

string source_extension(language lang) {
    if (lang == language::PY2) return "py";
    return language_tag(lang);
}

string language_name(language lang) {
    switch (lang) {
        case language::CPP: return "C++";
        case language::PAS: return "Pascal";
        case language::JAVA: return "Java";
        case language::PY: return "Python3";
        case language::PY2: return "Python2";
    }
    throw illegal_state_error("unknown language");
}

}  // namespace solbuild
