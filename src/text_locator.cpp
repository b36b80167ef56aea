#include "errorsmith/text_locator.hpp"

namespace errorsmith {

std::size_t find_keyword(std::string_view src, std::size_t start, std::string_view keyword){
    if(keyword.empty()) return keyword_npos;
    std::size_t i = start;
    while(i < src.size()){
        if(src.compare(i, keyword.size(), keyword) == 0) return i;
        if(i+1 < src.size() && src[i]=='/' && src[i+1]=='/'){
            while(i < src.size() && src[i] != '\n') ++i;
            continue;
        }
        if(i+1 < src.size() && src[i]=='/' && src[i+1]=='*'){
            i += 2;
            for(;;++i){
                if(i+1 >= src.size()) return keyword_npos;
                if(src[i]=='*' && src[i+1]=='/'){ i += 2; break; }
            }
            continue;
        }
        ++i;
    }
    return keyword_npos;
}

} // namespace errorsmith
