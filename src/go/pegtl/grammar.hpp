#pragma once
#include <tao/pegtl.hpp>

namespace errorsmith::go::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct line_comment : seq< two<'/'>, star< not_one<'\n'> > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct comment : sor< line_comment, block_comment > {};
struct ws : star< sor< space, comment > > {};
struct inline_ws : star< sor< blank, block_comment > > {};
// Statement separators: newlines, explicit semicolons, comments
struct sep : star< sor< space, comment, one<';'> > > {};

// tokens
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct identifier : seq< ident_first, star< ident_rest > > {};

struct kw_package : seq< string<'p','a','c','k','a','g','e'>, not_at< ident_rest > > {};
struct kw_func : seq< string<'f','u','n','c'>, not_at< ident_rest > > {};
struct kw_if : seq< string<'i','f'>, not_at< ident_rest > > {};
struct kw_else : seq< string<'e','l','s','e'>, not_at< ident_rest > > {};
struct kw_for : seq< string<'f','o','r'>, not_at< ident_rest > > {};
struct kw_switch : seq< string<'s','w','i','t','c','h'>, not_at< ident_rest > > {};
struct kw_select : seq< string<'s','e','l','e','c','t'>, not_at< ident_rest > > {};
struct kw_case : seq< string<'c','a','s','e'>, not_at< ident_rest > > {};
struct kw_default : seq< string<'d','e','f','a','u','l','t'>, not_at< ident_rest > > {};
struct kw_struct : seq< string<'s','t','r','u','c','t'>, not_at< ident_rest > > {};
struct kw_interface : seq< string<'i','n','t','e','r','f','a','c','e'>, not_at< ident_rest > > {};

// Literals. An unterminated literal simply fails and its quote is read as a plain character.
struct escaped : seq< one<'\\'>, any > {};
struct str_lit : seq< one<'"'>, until< one<'"'>, sor< escaped, not_one<'\n'> > > > {};
struct raw_lit : seq< one<'`'>, until< one<'`'> > > {};
struct rune_lit : seq< one<'\''>, until< one<'\''>, sor< escaped, not_one<'\n'> > > > {};

// `x++` ends a statement; a trailing binary operator or comma continues it onto the next line.
struct incdec : sor< two<'+'>, two<'-'> > {};
struct op_char : one<'+','-','*','/','%','&','|','^','<','>','=','!',',','.'> {};
struct continuation : seq< op_char, star< blank >, opt< line_comment >, eol > {};

// forward decls so we can reference before definitions
struct block;
struct group_item;

// Balanced groups may span lines and hold anything, including closures.
struct paren_group : seq< one<'('>, star< group_item >, must< one<')'> > > {};
struct bracket_group : seq< one<'['>, star< group_item >, must< one<']'> > > {};
struct brace_group : seq< one<'{'>, star< group_item >, must< one<'}'> > > {};
struct type_lit : seq< sor< kw_struct, kw_interface >, ws, brace_group > {};

struct atom_item : sor< comment, str_lit, raw_lit, rune_lit, paren_group, bracket_group, type_lit > {};

// Characters each context may consume outside any group.
struct simple_char : not_one< '\n', ';', '{', '}', '(', ')', '[', ']' > {};
struct header_char : not_one< ';', '{', '}', '(', ')', '[', ']' > {};
struct case_char : not_one< ':', '{', '}', '(', ')', '[', ']' > {};
struct group_char : not_one< '(', ')', '[', ']', '{', '}' > {};

// Function signature (parameters/results up to the body). No closures here, so a
// func type that turns out not to have a body backtracks without side effects.
struct sig_item : sor< atom_item, identifier, simple_char > {};
struct func_sig : star< sig_item > {};
struct func_lit : seq< kw_func, func_sig, block > {};

struct simple_item : sor< atom_item, func_lit, identifier, incdec, continuation, brace_group, simple_char > {};
struct header_item : sor< atom_item, func_lit, identifier, incdec, continuation, header_char > {};
struct define_op : seq< one<':'>, one<'='> > {};
struct case_item : sor< atom_item, func_lit, identifier, incdec, continuation, brace_group, define_op, case_char > {};
struct group_item : sor< atom_item, func_lit, identifier, brace_group, group_char > {};

// Blocks
struct stmt;
struct block_open : one<'{'> {};
struct block_close : one<'}'> {};
struct stmt_list : star< stmt, sep > {};
struct block : seq< block_open, sep, stmt_list, must< block_close > > {};
struct block_stmt : seq< block > {};

// if-statement: if [init;] cond block [else (if-statement | block)]
struct if_stmt;
struct if_kw : kw_if {};
struct if_clause_a : plus< header_item > {};
struct if_clause_b : plus< header_item > {};
struct if_header : seq< if_clause_a, opt< one<';'>, if_clause_b > > {};
struct if_body : seq< block > {};
struct else_if : seq< if_stmt > {};
struct else_block : seq< block > {};
struct else_clause : seq< inline_ws, kw_else, ws, must< sor< else_if, else_block > > > {};
struct if_stmt : seq< if_kw, must< if_header, if_body >, opt< else_clause > > {};

// for / switch / select
struct loop_header : star< sor< header_item, one<';'> > > {};
struct for_body : seq< block > {};
struct for_stmt : seq< kw_for, must< loop_header, for_body > > {};
struct case_head : sor< seq< kw_case, must< plus< case_item >, one<':'> > >,
                        seq< kw_default, must< ws, one<':'> > > > {};
struct case_clause : seq< case_head, sep, stmt_list > {};
struct clause_block : seq< block_open, sep, star< case_clause, sep >, must< block_close > > {};
struct switch_kw : sor< kw_switch, kw_select > {};
struct switch_stmt : seq< switch_kw, must< loop_header, clause_block > > {};

// Label: `Name:` (but not `x := ...`, nor a case clause head)
struct label : seq< not_at< sor< kw_case, kw_default > >, identifier, star< blank >, one<':'>, not_at< one<'='> > > {};
struct labeled_stmt : seq< label, sep, opt< stmt > > {};

// Everything else is one opaque statement running to the end of the line.
struct simple_stmt : seq< not_at< sor< kw_case, kw_default > >, plus< simple_item > > {};
struct stmt : sor< if_stmt, for_stmt, switch_stmt, block_stmt, labeled_stmt, simple_stmt > {};

// Top level: package clause, then declarations
struct package_name : identifier {};
struct package_clause : seq< kw_package, must< ws, package_name > > {};
struct func_body : seq< block > {};
struct func_decl : seq< kw_func, must< func_sig, opt< func_body > > > {};
struct top_text : plus< simple_item > {};
struct top_decl : sor< func_decl, top_text > {};
struct file_rule : must< sep, package_clause, sep, star< top_decl, sep >, eof > {};

// Condition classification: `ident (==|!=) ident` and nothing else.
struct cond_x : identifier {};
struct cond_op : sor< two<'='>, string<'!','='> > {};
struct cond_y : identifier {};
struct cond_rule : seq< ws, cond_x, ws, cond_op, ws, cond_y, ws, eof > {};

} // namespace errorsmith::go::pegtl_front::grammar
