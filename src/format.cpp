#include "errorsmith/format.hpp"
#include "errorsmith/go/parser.hpp"
#include <cctype>
#include <vector>

namespace errorsmith {

namespace {

enum class Lex { code, string, rune, raw, block_comment };

struct Opener { char c; std::size_t line; std::size_t indent; };

bool is_closer(char c){ return c==')' || c==']' || c=='}'; }
bool is_opener(char c){ return c=='(' || c=='[' || c=='{'; }

bool is_blank(char c){ return c==' ' || c=='\t' || c=='\r' || c=='\f' || c=='\v'; }

std::string_view trim_left(std::string_view s){ std::size_t i=0; while(i<s.size() && is_blank(s[i])) ++i; return s.substr(i); }
std::string_view trim_right(std::string_view s){ std::size_t n=s.size(); while(n>0 && is_blank(s[n-1])) --n; return s.substr(0,n); }

bool starts_with_word(std::string_view s, std::string_view w){
    if(s.compare(0, w.size(), w) != 0) return false;
    return s.size()==w.size() || !(std::isalnum((unsigned char)s[w.size()]) || s[w.size()]=='_');
}

// `case ...:` / `default:` / `Label:` lines sit one level left of the statements they head.
bool is_outdented(std::string_view s){
    if(starts_with_word(s, "case") || starts_with_word(s, "default")) return true;
    std::size_t i=0;
    if(i<s.size() && (std::isalpha((unsigned char)s[i]) || s[i]=='_')){
        while(i<s.size() && (std::isalnum((unsigned char)s[i]) || s[i]=='_')) ++i;
        if(i<s.size() && s[i]==':' && (i+1==s.size() || s[i+1]!='=')){
            std::string_view rest = trim_left(s.substr(i+1));
            return rest.empty() || rest.compare(0,2,"//")==0 || rest.compare(0,2,"/*")==0;
        }
    }
    return false;
}

} // namespace

std::string reindent(std::string_view src){
    std::vector<std::string_view> lines;
    for(std::size_t b=0;;){
        std::size_t nl = src.find('\n', b);
        if(nl == std::string_view::npos){ lines.push_back(src.substr(b)); break; }
        lines.push_back(src.substr(b, nl - b));
        b = nl + 1;
    }

    std::string out;
    std::vector<Opener> stack;
    Lex lex = Lex::code;
    bool continues = false;   // previous line ended with a binary operator
    std::size_t base = 0;     // depth of the first line of the current statement
    int blank_run = 0;
    bool any_code = false;

    for(std::size_t li=0; li<lines.size(); ++li){
        std::string_view line = lines[li];
        const bool verbatim = (lex == Lex::raw || lex == Lex::block_comment);
        std::string_view text = verbatim ? line : trim_left(line);

        if(!verbatim && trim_right(text).empty()){
            if(any_code) ++blank_run;
            continue;
        }
        if(blank_run > 0){ out += '\n'; blank_run = 0; }

        std::size_t i = 0;
        std::size_t depth = stack.empty() ? 0 : stack.back().indent + 1;
        // Openers on a continuation line belong to the statement's first line.
        std::size_t open_indent = depth;
        if(!verbatim){
            // A line starting with closers lines up with the line that opened the last of them.
            bool closed = false;
            while(i<text.size() && (is_closer(text[i]) || is_blank(text[i]))){
                if(is_closer(text[i]) && !stack.empty()){ depth = stack.back().indent; stack.pop_back(); closed = true; }
                ++i;
            }
            if(!closed && is_outdented(text)){ if(depth > 0) --depth; }
            if(!closed && !is_outdented(text) && continues){
                open_indent = base;
                depth = base + 1;
            } else {
                base = depth;
                open_indent = depth;
            }
        }

        char last = 0, prev = 0;
        for(; i<text.size(); ++i){
            const char c = text[i];
            const char n = i+1<text.size() ? text[i+1] : '\0';
            switch(lex){
                case Lex::code:
                    if(c=='/' && n=='/'){ i = text.size(); break; }
                    if(c=='/' && n=='*'){ lex = Lex::block_comment; ++i; break; }
                    if(c=='"') lex = Lex::string;
                    else if(c=='\'') lex = Lex::rune;
                    else if(c=='`') lex = Lex::raw;
                    else if(is_opener(c)) stack.push_back(Opener{c, li, open_indent});
                    else if(is_closer(c)){ if(!stack.empty()) stack.pop_back(); }
                    if(!is_blank(c)){ prev = last; last = c; }
                    break;
                case Lex::string:
                case Lex::rune:
                    if(c=='\\'){ ++i; break; }
                    if((lex==Lex::string && c=='"') || (lex==Lex::rune && c=='\'')){ lex = Lex::code; last = c; }
                    break;
                case Lex::raw:
                    if(c=='`'){ lex = Lex::code; last = c; }
                    break;
                case Lex::block_comment:
                    if(c=='*' && n=='/'){ lex = Lex::code; ++i; }
                    break;
            }
        }
        // Interpreted strings and runes never span lines.
        if(lex == Lex::string || lex == Lex::rune) lex = Lex::code;

        // Openers left unclosed on this line already indent the next one.
        const bool still_open = !stack.empty() && stack.back().line == li;
        const bool ends_in_code = (lex == Lex::code);
        continues = ends_in_code && !still_open && last != 0 &&
            std::string_view("+-*/%&|^<>=!.").find(last) != std::string_view::npos &&
            !((last=='+' && prev=='+') || (last=='-' && prev=='-'));

        if(verbatim){
            out.append(line.data(), line.size());
        } else {
            out.append(depth, '\t');
            std::string_view body = ends_in_code ? trim_right(text) : text;
            out.append(body.data(), body.size());
        }
        out += '\n';
        any_code = true;
    }
    return out;
}

FormatResult format_source(std::string_view src, std::string_view filename){
    go::Parser p;
    auto pr = p.parse_string(src, filename);
    FormatResult r;
    if(!pr.success){
        r.success = false;
        r.error_message = pr.error_message;
        r.line = pr.line; r.column = pr.column;
        return r;
    }
    r.success = true;
    r.output = reindent(src);
    return r;
}

} // namespace errorsmith
