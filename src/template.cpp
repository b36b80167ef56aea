#include "errorsmith/template.hpp"
#include <climits>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace errorsmith {

int make_denominator(double error_percent){
    if(!std::isfinite(error_percent) || error_percent <= 0.0){
        throw std::invalid_argument("error percent must be a positive number, got " + std::to_string(error_percent));
    }
    const double q = 100.0 / error_percent;
    if(q >= static_cast<double>(INT_MAX)){
        throw std::invalid_argument("error percent " + std::to_string(error_percent) + " is too small");
    }
    const int d = static_cast<int>(q);
    if(d <= 0){
        throw std::invalid_argument("error percent " + std::to_string(error_percent) + " yields no valid modulus (must be at most 100)");
    }
    return d;
}

std::string go_format_literal(std::string_view file){
    std::string out;
    for(char c : file){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '%': out += "%%"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[5]; std::snprintf(buf, sizeof(buf), "\\x%02x", (unsigned char)c); out += buf; }
                else out += c;
                break;
        }
    }
    return out;
}

std::string render_injection(std::string_view file, int line, int denominator, bool trace){
    const std::string where = go_format_literal(file) + ":" + std::to_string(line);
    std::ostringstream os;
    os << "if " << rand_package_name << ".Int()%" << denominator << " == 0 {\n";
    if(trace) os << "\t" << fmt_package_name << ".Printf(\"injected error at " << where << "\\n\")\n";
    os << "\t" << error_ident << " = " << fmt_package_name << ".Errorf(\"injected error at " << where << "\")\n";
    os << "}\n";
    return os.str();
}

std::string render_imports(){
    std::ostringstream os;
    os << "\nimport " << rand_package_name << " \"" << rand_package_path << "\"\n";
    os << "import " << fmt_package_name << " \"" << fmt_package_path << "\"\n";
    return os.str();
}

std::string render_references(){
    std::ostringstream os;
    os << "\nvar _ = " << rand_package_name << ".Int";
    os << "\nvar _ = " << fmt_package_name << ".Printf";
    return os.str();
}

} // namespace errorsmith
