#pragma once
#include <tao/pegtl.hpp>

namespace formula::syntax::grammar {
using namespace tao::pegtl;

template<typename Rule>
using tok = pad< Rule, space >;

// Identifiers
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct name : seq< ident_first, star< ident_rest > > {};

// Punctuation
struct comma : one<','> {};
struct lparen : one<'('> {};
struct rparen : one<')'> {};
struct lbracket : one<'['> {};
struct rbracket : one<']'> {};
struct lbrace : one<'{'> {};
struct rbrace : one<'}'> {};
struct colon : one<':'> {};
struct dot : one<'.'> {};

// Operators. Prefix +/- are separate rules from the binary ones so the adapter can tell them apart.
struct op_assign : seq< one<'='>, not_at< one<'='> > > {};
struct op_pipe : seq< one<'|'>, not_at< one<'|'> > > {};
struct op_or : two<'|'> {};
struct op_and : two<'&'> {};
struct op_eq : two<'='> {};
struct op_ne : string<'!','='> {};
struct op_le : string<'<','='> {};
struct op_lt : one<'<'> {};
struct op_ge : string<'>','='> {};
struct op_gt : one<'>'> {};
struct op_add : one<'+'> {};
struct op_sub : one<'-'> {};
struct op_mul : one<'*'> {};
struct op_div : one<'/'> {};
struct op_mod : one<'%'> {};
struct op_pow : one<'^'> {};
struct op_not : seq< one<'!'>, not_at< one<'='> > > {};
struct op_plus : one<'+'> {};
struct op_minus : one<'-'> {};

// Literals
struct boolean_literal : sor< keyword<'t','r','u','e'>, keyword<'f','a','l','s','e'> > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct float_literal : sor< seq< plus< digit >, one<'.'>, plus< digit >, opt< exponent > >,
                            seq< plus< digit >, exponent > > {};
struct int_literal : seq< plus< digit >, not_at< ident_first > > {};
struct dq_char : sor< seq< one<'\\'>, any >, not_one<'"','\\'> > {};
struct sq_char : sor< seq< one<'\\'>, any >, not_one<'\'','\\'> > {};
struct string_literal : sor< seq< one<'"'>, star< dq_char >, one<'"'> >,
                             seq< one<'\''>, star< sq_char >, one<'\''> > > {};

// Cell addresses: upper-case column letters followed by a row number
struct cell_address : seq< plus< upper >, plus< digit >, not_at< ident_rest > > {};
struct range_ref : seq< cell_address, one<':'>, cell_address > {};
struct cell_ref : seq< cell_address > {};

struct expression; // forward

struct group : seq< tok< lparen >, expression, tok< rparen > > {};
struct sequence : list< expression, comma, space > {};
struct array : seq< tok< lbracket >, opt< sequence >, tok< rbracket > > {};
struct object_entry : seq< name, tok< colon >, expression > {};
struct object : seq< tok< lbrace >, opt< list< object_entry, comma, space > >, tok< rbrace > > {};

// Comma separated slots, each of which may be empty so partial input such as f(x,,y) parses.
// Positional slots after a named one are accepted here and rejected by the adapter.
struct named_argument : seq< name, tok< op_assign >, expression > {};
struct argument_slot : opt< sor< named_argument, expression > > {};
struct arguments : seq< argument_slot, star< tok< comma >, argument_slot > > {};
struct call : seq< name, star< space >, tok< lparen >, arguments, tok< rparen > > {};

// call comes before the address rules so names such as LOG10( are calls, not cells.
struct primary : sor< group, array, object, boolean_literal, float_literal, int_literal, string_literal,
                      call, range_ref, cell_ref, name > {};

struct member_suffix : seq< tok< dot >, name > {};
struct index_suffix : seq< tok< lbracket >, expression, tok< rbracket > > {};
struct postfix_expr : seq< primary, star< sor< member_suffix, index_suffix > > > {};

struct unary_expr; // forward
// Right associative: 2^3^2 is 2^(3^2)
struct power_expr : seq< postfix_expr, opt< tok< op_pow >, unary_expr > > {};
struct prefix_expr : seq< sor< op_not, op_plus, op_minus >, star< space >, unary_expr > {};
struct unary_expr : sor< prefix_expr, power_expr > {};

// Binary levels, tightest first. Each stores a flat operand/operator list the adapter folds left.
struct multiplicative_expr : seq< unary_expr, star< tok< sor< op_mul, op_div, op_mod > >, unary_expr > > {};
struct additive_expr : seq< multiplicative_expr, star< tok< sor< op_add, op_sub > >, multiplicative_expr > > {};
struct relational_expr : seq< additive_expr, star< tok< sor< op_le, op_lt, op_ge, op_gt > >, additive_expr > > {};
struct equality_expr : seq< relational_expr, star< tok< sor< op_eq, op_ne > >, relational_expr > > {};
struct and_expr : seq< equality_expr, star< tok< op_and >, equality_expr > > {};
struct or_expr : seq< and_expr, star< tok< op_or >, and_expr > > {};
struct pipe_expr : seq< or_expr, star< tok< op_pipe >, or_expr > > {};
struct expression : seq< pipe_expr > {};

struct definition : seq< name, tok< op_assign >, expression > {};

struct evaluation : seq< star< space >, must< sor< definition, expression > >, star< space >, must< eof > > {};

} // namespace formula::syntax::grammar
