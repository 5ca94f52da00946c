#include <csb/codegen_error.hpp>
#include <csb/constraints.hpp>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <string>

using namespace csb;

static api
make_api() {
  namespace_def ns("shapes");
  ns.add(union_type(type_id("shapes", "Color"),
                    {union_field("red"), union_field("green")}));
  ns.add(struct_type(type_id("shapes", "Point"),
                     {field("x", type_expr(type_kind::int32))}));
  api model;
  model.add(std::move(ns));
  model.resolve();
  return model;
}

namespace {

  struct constraint_fixture {
    api model = make_api();
    type_map types = type_map::defaults();
    name_cache names;
    type_mapper mapper{model, types, names, "Api"};
    constraint_compiler compiler{mapper};
    mapping_context ctx{"shapes", name_scope{}};

    std::string
    emitted(const field& f) {
      cs_body body;
      compiler.emit(body, compiler.compile(f, ctx));
      return body.str();
    }
  };

  facet_set
  string_facets() {
    facet_set f;
    f.min_length = 1;
    f.max_length = 10;
    f.pattern = "^[a-z]+$";
    return f;
  }

} // namespace

TEST_CASE("string field checks null, then length and pattern",
          "[constraints]") {
  constraint_fixture fx;
  field f("name", type_expr(type_kind::string, string_facets()));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK(c.null_check);
  CHECK_FALSE(c.present_guard);
  CHECK(c.condition() ==
        R"(name.Length < 1 || name.Length > 10 || !re.Regex.IsMatch(name, @"^[a-z]+$"))");

  CHECK(fx.emitted(f) ==
        "if (name == null)\n"
        "{\n"
        "    throw new sys.ArgumentNullException(\"name\");\n"
        "}\n"
        "else if (name.Length < 1 || name.Length > 10 || "
        "!re.Regex.IsMatch(name, @\"^[a-z]+$\"))\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"name\");\n"
        "}\n");
}

TEST_CASE("list field validates its defensive copy", "[constraints]") {
  constraint_fixture fx;
  facet_set items;
  items.min_items = 1;
  field f("tags", type_expr::list_of(type_expr(type_kind::string), items));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK(c.stored_value() == "tagsList");
  CHECK(c.list_copy_element == std::optional<std::string>("string"));

  CHECK(fx.emitted(f) ==
        "var tagsList = new col.List<string>(tags ?? new string[0]);\n"
        "\n"
        "if (tags == null)\n"
        "{\n"
        "    throw new sys.ArgumentNullException(\"tags\");\n"
        "}\n"
        "else if (tagsList.Count < 1)\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"tags\");\n"
        "}\n");
}

TEST_CASE("nullable list copies null as empty and guards its counts",
          "[constraints]") {
  constraint_fixture fx;
  facet_set items;
  items.min_items = 1;
  field f("tags", type_expr::nullable_of(type_expr::list_of(
                      type_expr(type_kind::string), items)));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK_FALSE(c.null_check);
  CHECK(c.present_guard);
  CHECK(fx.emitted(f) ==
        "var tagsList = new col.List<string>(tags ?? new string[0]);\n"
        "\n"
        "if (tags != null && (tagsList.Count < 1))\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"tags\");\n"
        "}\n");
}

TEST_CASE("nullable field checks only a present value", "[constraints]") {
  constraint_fixture fx;
  facet_set bounds;
  bounds.min_value = "0";
  bounds.max_value = "10";
  field f("count",
          type_expr::nullable_of(type_expr(type_kind::int32, bounds)));

  CHECK(fx.emitted(f) ==
        "if (count != null && (count < 0 || count > 10))\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"count\");\n"
        "}\n");
}

TEST_CASE("numeric bounds carry the literal suffix", "[constraints]") {
  constraint_fixture fx;
  facet_set bounds;
  bounds.max_value = "100";
  field f("limit", type_expr(type_kind::uint32, bounds));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK_FALSE(c.null_check);
  REQUIRE(c.checks.size() == 1);
  CHECK(c.checks[0] == range_check{check_kind::max_value, "100U"});
  CHECK(c.condition() == "limit > 100U");
}

TEST_CASE("defaulted string skips null rejection", "[constraints]") {
  constraint_fixture fx;
  facet_set len;
  len.max_length = 5;
  field f("title", type_expr(type_kind::string, len), "abc");

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK_FALSE(c.null_check);
  CHECK(c.present_guard);
  CHECK(fx.emitted(f) ==
        "if (title != null && (title.Length > 5))\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"title\");\n"
        "}\n");

  auto p = fx.compiler.parameter(f, fx.ctx);
  CHECK(p == cs_parameter{"string", "title", R"(@"abc")"});
}

TEST_CASE("union default substitutes the variant singleton",
          "[constraints]") {
  constraint_fixture fx;
  field f("background", type_expr::reference_to(type_id("shapes", "Color")),
          "red");

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK(c.union_default == std::optional<std::string>("Color.Red.Instance"));
  CHECK_FALSE(c.null_check);

  CHECK(fx.emitted(f) ==
        "if (background == null)\n"
        "{\n"
        "    background = Color.Red.Instance;\n"
        "}\n");

  CHECK(fx.compiler.parameter(f, fx.ctx).default_value == "null");
}

TEST_CASE("unconstrained value field emits nothing", "[constraints]") {
  constraint_fixture fx;
  field f("x", type_expr(type_kind::int32));
  CHECK(fx.emitted(f).empty());
}

TEST_CASE("reserved word field names the unescaped parameter in errors",
          "[constraints]") {
  constraint_fixture fx;
  field f("class", type_expr(type_kind::string));
  CHECK(fx.emitted(f) ==
        "if (@class == null)\n"
        "{\n"
        "    throw new sys.ArgumentNullException(\"class\");\n"
        "}\n");
}

TEST_CASE("errors name the parameter, not the schema field", "[constraints]") {
  constraint_fixture fx;
  field f("items_list", type_expr(type_kind::string));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK(c.arg_name == "itemsList");
  CHECK(c.display_name == "itemsList");
  CHECK(fx.emitted(f) ==
        "if (itemsList == null)\n"
        "{\n"
        "    throw new sys.ArgumentNullException(\"itemsList\");\n"
        "}\n");
}

TEST_CASE("list copy avoids names already declared", "[constraints]") {
  constraint_fixture fx;
  field f("items", type_expr::list_of(type_expr(type_kind::string)));

  auto c = fx.compiler.compile(f, fx.ctx, {"items", "itemsList"});
  CHECK(c.stored_value() == "itemsList2");

  auto taken = fx.compiler.compile(f, fx.ctx, {"itemsList", "itemsList2"});
  CHECK(taken.stored_value() == "itemsList3");

  cs_body body;
  fx.compiler.emit(body, c);
  CHECK(body.str().rfind(
            "var itemsList2 = new col.List<string>(items ?? new string[0]);\n",
            0) == 0);
}

TEST_CASE("reserved word list copies drop the escape", "[constraints]") {
  constraint_fixture fx;
  field f("class", type_expr::list_of(type_expr(type_kind::int32)));

  auto c = fx.compiler.compile(f, fx.ctx);
  CHECK(c.stored_value() == "classList");
  CHECK(fx.emitted(f).rfind(
            "var classList = new col.List<int>(@class ?? new int[0]);\n", 0) ==
        0);
}

TEST_CASE("constructor parameters carry defaults", "[constraints]") {
  constraint_fixture fx;

  auto nullable = fx.compiler.parameter(
      field("count", type_expr::nullable_of(type_expr(type_kind::int32))),
      fx.ctx);
  CHECK(nullable == cs_parameter{"int?", "count", "null"});

  auto scale = fx.compiler.parameter(
      field("scale", type_expr(type_kind::float32), "1.5"), fx.ctx);
  CHECK(scale == cs_parameter{"float", "scale", "1.5F"});

  auto list = fx.compiler.parameter(
      field("tags", type_expr::list_of(type_expr(type_kind::string))),
      fx.ctx);
  CHECK(list == cs_parameter{"col.IEnumerable<string>", "tags", ""});
}

TEST_CASE("default assignment for the deserialization constructor",
          "[constraints]") {
  constraint_fixture fx;
  cs_body body;
  fx.compiler.emit_default(
      body, field("visible", type_expr(type_kind::boolean), "true"),
      "this.Visible", fx.ctx);
  CHECK(body.str() == "this.Visible = true;\n");

  CHECK_THROWS_AS(fx.compiler.emit_default(
                      body, field("x", type_expr(type_kind::int32)), "this.X",
                      fx.ctx),
                  codegen_error);
}

TEST_CASE("struct-typed default is a generation error", "[constraints]") {
  constraint_fixture fx;
  field f("corner", type_expr::reference_to(type_id("shapes", "Point")),
          "origin");
  CHECK_THROWS_AS(fx.compiler.compile(f, fx.ctx), codegen_error);
}
