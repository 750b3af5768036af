#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "stanza/parser.hh"

using namespace stanza;

namespace {

std::vector<TokenKind> kinds(const std::vector<Token> &tokens) {
  std::vector<TokenKind> out;
  for (const auto &t : tokens) out.push_back(t.kind);
  return out;
}

// Message of the SyntaxError thrown by parse(), or "" if none was thrown
std::string syntax_error(const std::string &text, const std::string &origin = "", int max_depth = 64) {
  try {
    parse(text, origin, max_depth);
  } catch (const SyntaxError &e) {
    return e.what();
  }
  return "";
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(Tokenize, SplitsTextAndTags) {
  auto tokens = tokenize("Hello {{name}}!{{#if a}}x{{else}}y{{/if}}{{#each xs}}{{{this}}}{{/each}}");
  EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{TokenKind::Text, TokenKind::Substitution, TokenKind::Text,
                                                   TokenKind::OpenIf, TokenKind::Text, TokenKind::Else, TokenKind::Text,
                                                   TokenKind::CloseIf, TokenKind::OpenEach,
                                                   TokenKind::RawSubstitution, TokenKind::CloseEach}));
  EXPECT_EQ(tokens[0].text, "Hello ");
  EXPECT_EQ(tokens[1].text, "name");
  EXPECT_EQ(tokens[3].text, "a");
  EXPECT_EQ(tokens[8].text, "xs");
  EXPECT_EQ(tokens[9].text, "this");
}

TEST(Tokenize, TagBodiesAreTrimmed) {
  auto tokens = tokenize("{{  user.name  }}{{ / if }}");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].text, "user.name");
  EXPECT_EQ(tokens[1].kind, TokenKind::CloseIf);
}

TEST(Tokenize, BangMarksRawSubstitution) {
  auto tokens = tokenize("{{!html}}");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].kind, TokenKind::RawSubstitution);
  EXPECT_EQ(tokens[0].text, "html");
}

TEST(Tokenize, EscapedDelimiterIsLiteralText) {
  auto tokens = tokenize("a \\{{ not a tag }} b");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].kind, TokenKind::Text);
  EXPECT_EQ(tokens[0].text, "a {{ not a tag }} b");
}

TEST(Tokenize, TracksLineAndColumn) {
  auto tokens = tokenize("ab\ncd {{x}}\n\n  {{/if}}");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[1].where.line, 2u);
  EXPECT_EQ(tokens[1].where.column, 4u);
  EXPECT_EQ(tokens[3].where.line, 4u);
  EXPECT_EQ(tokens[3].where.column, 3u);
}

TEST(ParseExpression, SingleWords) {
  Expression path = parse_expression("user.name", SourceLocation());
  EXPECT_TRUE(path.is_plain_path());
  EXPECT_EQ(path.operand.segments, (std::vector<std::string>{"user", "name"}));

  Expression lit = parse_expression("'hello world'", SourceLocation());
  EXPECT_EQ(lit.kind, ExprKind::Operand);
  EXPECT_TRUE(lit.operand.is_literal);
  EXPECT_FALSE(lit.is_plain_path());
  EXPECT_EQ(to_string_any(lit.operand.literal), "hello world");

  Expression local = parse_expression("@index", SourceLocation());
  EXPECT_TRUE(local.is_plain_path());
}

TEST(ParseExpression, HelperCalls) {
  Expression e = parse_expression("equals env 'api'", SourceLocation());
  EXPECT_EQ(e.kind, ExprKind::HelperCall);
  EXPECT_EQ(e.helper, "equals");
  ASSERT_EQ(e.args.size(), 2u);
  EXPECT_FALSE(e.args[0].is_literal);
  EXPECT_EQ(e.args[0].text, "env");
  EXPECT_TRUE(e.args[1].is_literal);

  Expression j = parse_expression("join features ', '", SourceLocation());
  ASSERT_EQ(j.args.size(), 2u);
  EXPECT_EQ(to_string_any(j.args[1].literal), ", ");
}

TEST(ParseExpression, Malformed) {
  EXPECT_THROW(parse_expression("'open", SourceLocation()), SyntaxError);
  EXPECT_THROW(parse_expression("'a'b", SourceLocation()), SyntaxError);
  EXPECT_THROW(parse_expression("a..b", SourceLocation()), SyntaxError);
  EXPECT_THROW(parse_expression("user.", SourceLocation()), SyntaxError);
  EXPECT_THROW(parse_expression("'str' x", SourceLocation()), SyntaxError);
}

TEST(Parse, BuildsNestedTree) {
  auto nodes = parse("A{{#if x}}B{{#each ys}}C{{this}}{{/each}}{{else}}D{{/if}}E");
  ASSERT_EQ(nodes.size(), 3u);
  EXPECT_EQ(nodes[0].kind, NodeKind::Text);
  EXPECT_EQ(nodes[2].text, "E");

  const Node &cond = nodes[1];
  ASSERT_EQ(cond.kind, NodeKind::Conditional);
  EXPECT_EQ(cond.cond.negations, 0u);
  ASSERT_EQ(cond.body.size(), 2u);
  ASSERT_EQ(cond.alt.size(), 1u);
  EXPECT_EQ(cond.alt[0].text, "D");

  const Node &loop = cond.body[1];
  ASSERT_EQ(loop.kind, NodeKind::Iteration);
  EXPECT_EQ(loop.expr.operand.text, "ys");
  ASSERT_EQ(loop.body.size(), 2u);
  EXPECT_EQ(loop.body[1].kind, NodeKind::Substitution);
  EXPECT_FALSE(loop.body[1].raw);
}

TEST(Parse, NegatedConditions) {
  auto nodes = parse("{{#if !ready}}x{{/if}}{{#if ! ! ready}}y{{/if}}");
  ASSERT_EQ(nodes.size(), 2u);
  EXPECT_EQ(nodes[0].cond.negations, 1u);
  EXPECT_EQ(nodes[1].cond.negations, 2u);
  EXPECT_EQ(nodes[1].cond.expr.operand.text, "ready");
}

TEST(Parse, ConditionsMayCallHelpers) {
  auto nodes = parse("{{#if equals env 'api'}}x{{/if}}");
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(nodes[0].cond.expr.kind, ExprKind::HelperCall);
}

TEST(ParseErrors, UnmatchedClosers) {
  EXPECT_TRUE(contains(syntax_error("x{{/if}}"), "Unmatched {{/if}}"));
  EXPECT_TRUE(contains(syntax_error("{{/each}}"), "Unmatched {{/each}}"));
  EXPECT_TRUE(contains(syntax_error("{{else}}"), "Unmatched {{else}}"));
}

TEST(ParseErrors, UnterminatedBlocks) {
  std::string msg = syntax_error("{{#if a}}open forever");
  EXPECT_TRUE(contains(msg, "Unterminated block"));
  EXPECT_TRUE(contains(msg, "{{#if}} opened at line 1, column 1"));
  EXPECT_TRUE(contains(syntax_error("{{#each xs}}{{#if a}}{{/if}}"), "{{#each}}"));
}

TEST(ParseErrors, MismatchedClosers) {
  EXPECT_TRUE(contains(syntax_error("{{#if a}}x{{/each}}"), "Expected {{/if}} but found {{/each}}"));
  EXPECT_TRUE(contains(syntax_error("{{#each a}}x{{/if}}"), "Expected {{/each}} but found {{/if}}"));
  EXPECT_TRUE(contains(syntax_error("{{#each a}}x{{else}}y{{/each}}"), "Expected {{/each}} but found {{else}}"));
  EXPECT_TRUE(contains(syntax_error("{{#if a}}x{{else}}y{{else}}z{{/if}}"), "Second {{else}}"));
}

TEST(ParseErrors, MalformedTags) {
  EXPECT_TRUE(contains(syntax_error("{{#unless a}}x{{/unless}}"), "Unknown block '#unless'"));
  EXPECT_TRUE(contains(syntax_error("{{#if}}x{{/if}}"), "requires an argument"));
  EXPECT_TRUE(contains(syntax_error("{{/with}}"), "Unknown closing block"));
  EXPECT_TRUE(contains(syntax_error("Hello {{name"), "Unterminated tag"));
  EXPECT_TRUE(contains(syntax_error("{{{raw}}"), "Unterminated tag"));
  EXPECT_TRUE(contains(syntax_error("{{   }}"), "Empty tag"));
  EXPECT_TRUE(contains(syntax_error("{{!}}"), "Empty tag"));
  EXPECT_TRUE(contains(syntax_error("{{{#if a}}}"), "not allowed"));
  EXPECT_TRUE(contains(syntax_error("{{#if !}}x{{/if}}"), "Negation without a condition"));
  EXPECT_TRUE(contains(syntax_error("{{ a..b }}"), "Invalid path"));
}

TEST(ParseErrors, ReportLocationAndOrigin) {
  try {
    parse("line one\n  {{/if}}", "deploy.sh.template");
    FAIL() << "expected a syntax error";
  } catch (const SyntaxError &e) {
    EXPECT_EQ(e.line(), 2u);
    EXPECT_EQ(e.column(), 3u);
    EXPECT_EQ(std::string(e.what()), "deploy.sh.template:2:3: Unmatched {{/if}}");
  }
}

TEST(ParseErrors, NestingLimit) {
  const std::string two = "{{#if a}}{{#each b}}x{{/each}}{{/if}}";
  const std::string three = "{{#if a}}{{#each b}}{{#if c}}x{{/if}}{{/each}}{{/if}}";
  EXPECT_NO_THROW(parse(two, "", 2));
  EXPECT_TRUE(contains(syntax_error(three, "", 2), "nested deeper than 2"));
  EXPECT_NO_THROW(parse(three));
}

TEST(ParseErrors, SyntaxErrorIsAnError) {
  EXPECT_THROW(parse("{{/if}}"), Error);
  EXPECT_THROW(parse("{{/if}}"), std::runtime_error);
}
