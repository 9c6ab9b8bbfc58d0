#include "Expression.hpp"

#include "Config.hpp"
#include "LocalDomains.hpp"

#include <map>

#include <glog/logging.h>

using namespace Expr;

namespace {
struct Vars : Resolver {
  std::map<Variable, Value> values;

  Value resolve(Variable var) const override
  {
    auto const it = values.find(var);
    return it == values.end() ? Value{std::string{}} : it->second;
  }
};

Value eval(std::string_view text,
           Resolver const&  vars,
           LocalDomains const* domains = nullptr,
           std::uint32_t       allowed = Context::host)
{
  std::string msg;
  auto const  expr = Expression::parse(text, allowed, msg);
  CHECK(expr) << text << ": " << msg;
  return expr->eval(vars, domains);
}

bool parses(std::string_view text, std::uint32_t allowed = Context::host)
{
  std::string msg;
  return Expression::parse(text, allowed, msg).has_value();
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Vars vars;
  vars.values[Variable::rcpt]        = Value{std::string("bob@example.org")};
  vars.values[Variable::rcpt_domain] = Value{std::string("example.org")};
  vars.values[Variable::sender]      = Value{std::string("alice@Example.COM")};
  vars.values[Variable::retry_num]   = Value{std::int64_t{2}};
  vars.values[Variable::last_error] = Value{std::string("tls")};
  vars.values[Variable::size]        = Value{std::int64_t{1500}};

  StaticDomains const domains{"example.org"};

  CHECK_EQ(to_string(eval("'local'", vars)), "local");
  CHECK_EQ(to_string(eval("\"it's\"", vars)), "it's");
  CHECK_EQ(to_string(eval("42", vars)), "42");
  CHECK(to_bool(eval("true", vars)));
  CHECK(!to_bool(eval("false", vars)));
  CHECK(!to_bool(eval("!true", vars)));

  CHECK(to_bool(eval("rcpt_domain == 'example.org'", vars)));
  CHECK(to_bool(eval("rcpt_domain != 'example.com'", vars)));
  CHECK(to_bool(eval("retry_num > 0 && last_error == 'tls'", vars)));
  CHECK(!to_bool(eval("retry_num > 2 || last_error == 'dns'", vars)));
  CHECK(to_bool(eval("size >= 1500 && size < 2000", vars)));
  CHECK(to_bool(eval("!(size <= 1000)", vars)));

  CHECK_EQ(to_string(eval("'MAILER-DAEMON@' + rcpt_domain", vars)),
           "MAILER-DAEMON@example.org");
  CHECK_EQ(to_string(eval("retry_num + 1", vars)), "3");

  CHECK(to_bool(eval("is_local_domain(rcpt_domain)", vars, &domains)));
  CHECK(!to_bool(eval("is_local_domain('example.com')", vars, &domains)));
  CHECK(!to_bool(eval("is_local_domain(rcpt_domain)", vars)));

  CHECK(to_bool(eval("starts_with(rcpt, 'bob@')", vars)));
  CHECK(to_bool(eval("ends_with(rcpt, '.org')", vars)));
  CHECK(to_bool(eval("contains(rcpt, '@')", vars)));
  CHECK_EQ(to_string(eval("lowercase(sender)", vars)), "alice@example.com");
  CHECK(to_bool(eval("ends_with(lowercase(sender), 'example.com')", vars)));

  // Variables beyond the context are refused.
  CHECK(parses("sender == ''", Context::sender));
  CHECK(!parses("rcpt == ''", Context::sender));
  CHECK(!parses("mx == ''", Context::rcpt));
  CHECK(parses("mx == ''", Context::host));
  CHECK(!parses("helo_domain == ''", Context::host));
  CHECK(parses("helo_domain == ''", Context::rcpt_to));

  CHECK(!parses("no_such_var"));
  CHECK(!parses("no_such_fn(rcpt)"));
  CHECK(!parses("starts_with(rcpt)"));
  CHECK(!parses("rcpt =="));
  CHECK(!parses("'unterminated"));
  CHECK(!parses("(rcpt"));

  std::string msg;
  auto const  expr = Expression::parse("is_local_domain(rcpt_domain) && retry_num > 0",
                                       Context::rcpt, msg);
  CHECK(expr);
  CHECK_EQ(expr->variables(),
           bit(Variable::rcpt_domain) | bit(Variable::retry_num));

  CHECK(variable_named("last_error") == Variable::last_error);
  CHECK(!variable_named("nope"));
  CHECK_EQ(name_of(Variable::helo_domain), "helo_domain");

  // If blocks, built in.
  IfBlock const route("queue.strategy.route",
                      {{"is_local_domain(rcpt_domain)", "'local'"}}, "'mx'",
                      Context::rcpt);
  CHECK_EQ(*route.eval_string(vars, &domains), "local");
  CHECK_EQ(*route.eval_string(vars, nullptr), "mx");

  IfBlock const nothing("x", {{"false", "'a'"}}, "", Context::rcpt);
  CHECK(!nothing.eval(vars, nullptr));

  // If blocks, configured as a chain. Numeric ids sort numerically.
  Config config;
  config.add("queue.strategy.tls.10.if", "retry_num > 1");
  config.add("queue.strategy.tls.10.then", "'ten'");
  config.add("queue.strategy.tls.9.if", "last_error == 'tls'");
  config.add("queue.strategy.tls.9.then", "'nine'");
  config.add("queue.strategy.tls.else", "'default'");
  auto const tls = IfBlock::parse(config, "queue.strategy.tls", Context::host);
  CHECK(tls);
  CHECK(!config.has_errors());
  CHECK_EQ(*tls->eval_string(vars, nullptr), "nine");
  vars.values[Variable::last_error] = Value{std::string("dns")};
  CHECK_EQ(*tls->eval_string(vars, nullptr), "ten");
  vars.values[Variable::retry_num] = Value{std::int64_t{0}};
  CHECK_EQ(*tls->eval_string(vars, nullptr), "default");

  // A single expression.
  config.add("queue.strategy.connection", "'pool-' + rcpt_domain");
  auto const conn
      = IfBlock::parse(config, "queue.strategy.connection", Context::host);
  CHECK(conn);
  CHECK_EQ(*conn->eval_string(vars, nullptr), "pool-example.org");

  // Not configured.
  CHECK(!IfBlock::parse(config, "queue.strategy.route", Context::rcpt));
  CHECK(!config.has_errors());

  // Bad entries are reported, the block isn't used.
  config.add("report.dsn.from-name.1.if", "rcpt == 'x'");
  config.add("report.dsn.from-name.1.then", "'X'");
  CHECK(!IfBlock::parse(config, "report.dsn.from-name", Context::sender));
  CHECK(config.has_errors());

  config.add("queue.strategy.schedule.1.if", "true");
  CHECK(!IfBlock::parse(config, "queue.strategy.schedule", Context::rcpt));
}
