#pragma once
#include "../prelude.hpp"
#include "../grammar.hpp"
#include "statements.hpp"
#include <tao/pegtl.hpp>

namespace errorsmith::go::pegtl_front::actions {
using namespace tao::pegtl;
using errorsmith::go::pegtl_front::build_state;

template<> struct action< grammar::package_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.package_name = in.string();
        st.package_name_end = st.end_of(in);
    }
};

template<> struct action< grammar::func_body > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.pending.push_back(st.pop_block()); }
};
template<> struct action< grammar::func_decl > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push_opaque(OpaqueKind::func_decl, st.begin_of(in), st.end_of(in), st.take_pending());
    }
};
// import / var / const / type declarations
template<> struct action< grammar::top_text > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push_opaque(OpaqueKind::decl, st.begin_of(in), st.end_of(in), st.take_pending());
    }
};

} // namespace errorsmith::go::pegtl_front::actions
