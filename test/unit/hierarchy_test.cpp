#include <csb/hierarchy.hpp>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <string>

using namespace csb;

static type_id
shapes(const std::string& name) {
  return type_id("shapes", name);
}

static struct_type
shape_root(bool catch_all) {
  return struct_type(shapes("Shape"),
                     {field("label", type_expr::nullable_of(
                                         type_expr(type_kind::string)))},
                     std::nullopt,
                     {{"circle", shapes("Circle")},
                      {"square", shapes("Square")},
                      {"unknown", shapes("UnknownShape")}},
                     catch_all);
}

// Shape family with a catch-all subtype, and a closed Animal family.
static api
make_api(bool root_is_catch_all = false) {
  namespace_def ns("shapes");
  ns.add(shape_root(root_is_catch_all));
  ns.add(struct_type(shapes("Circle"),
                     {field("radius", type_expr(type_kind::float64))},
                     shapes("Shape")));
  ns.add(struct_type(shapes("Square"),
                     {field("side", type_expr(type_kind::float64))},
                     shapes("Shape")));
  ns.add(struct_type(shapes("UnknownShape"), {}, shapes("Shape"), {},
                     !root_is_catch_all));

  ns.add(struct_type(shapes("Animal"), {}, std::nullopt,
                     {{"dog", shapes("Dog")}}));
  ns.add(struct_type(shapes("Dog"), {}, shapes("Animal")));

  ns.add(struct_type(
      shapes("Canvas"),
      {field("main", type_expr::nullable_of(
                         type_expr::reference_to(shapes("Circle")))),
       field("pets", type_expr::list_of(
                         type_expr::reference_to(shapes("Dog"))))}));

  ns.add(union_type(shapes("Color"), {union_field("red"), union_field("other")},
                    std::string("other")));
  ns.add(union_type(shapes("Mood"), {union_field("happy")}));

  api model;
  model.add(std::move(ns));
  model.resolve();
  return model;
}

TEST_CASE("subtype tags come from the parent's list", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  CHECK(h.tag(*model.find_struct(shapes("Circle"))) ==
        std::optional<std::string>("circle"));
  CHECK(h.tag(*model.find_struct(shapes("Square"))) ==
        std::optional<std::string>("square"));
}

TEST_CASE("catch-all members and plain structs have no tag", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  CHECK_FALSE(h.tag(*model.find_struct(shapes("UnknownShape"))).has_value());
  CHECK_FALSE(h.tag(*model.find_struct(shapes("Shape"))).has_value());
  CHECK_FALSE(h.tag(*model.find_struct(shapes("Canvas"))).has_value());
}

TEST_CASE("tags are memoized", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);
  const auto& circle = *model.find_struct(shapes("Circle"));

  const auto& first = h.tag(circle);
  const auto& second = h.tag(circle);
  CHECK(&first == &second);
  CHECK(h.cached_tags() == 1);
}

TEST_CASE("enumerating parent", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  CHECK(h.enumerating_parent(*model.find_struct(shapes("Circle"))) ==
        model.find_struct(shapes("Shape")));
  CHECK(h.enumerating_parent(*model.find_struct(shapes("Shape"))) == nullptr);
}

TEST_CASE("subtypes keep declaration order", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  auto members = h.subtypes(*model.find_struct(shapes("Shape")));
  REQUIRE(members.size() == 3);
  CHECK(members[0].type == model.find_struct(shapes("Circle")));
  CHECK(members[0].tag == std::optional<std::string>("circle"));
  CHECK(members[1].type == model.find_struct(shapes("Square")));
  CHECK(members[2].type == model.find_struct(shapes("UnknownShape")));
  CHECK_FALSE(members[2].tag.has_value());
}

TEST_CASE("family with a catch-all subtype is open", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);
  const auto& shape = *model.find_struct(shapes("Shape"));

  CHECK(h.catch_all(shape) == model.find_struct(shapes("UnknownShape")));
  CHECK(h.is_open(shape));
}

TEST_CASE("root can be the catch-all", "[hierarchy]") {
  auto model = make_api(true);
  hierarchy_resolver h(model);
  const auto& shape = *model.find_struct(shapes("Shape"));

  CHECK(h.catch_all(shape) == &shape);
  CHECK(h.tag(*model.find_struct(shapes("UnknownShape"))) ==
        std::optional<std::string>("unknown"));
}

TEST_CASE("family without a catch-all is closed", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  CHECK(h.catch_all(*model.find_struct(shapes("Animal"))) == nullptr);
  CHECK_FALSE(h.is_open(*model.find_struct(shapes("Animal"))));
}

TEST_CASE("union openness follows its catch-all field", "[hierarchy]") {
  auto model = make_api();
  hierarchy_resolver h(model);

  CHECK(h.is_open(*model.find_union(shapes("Color"))));
  CHECK_FALSE(h.is_open(*model.find_union(shapes("Mood"))));
}

TEST_CASE("related types link parents, children and holders",
          "[hierarchy]") {
  auto model = make_api();
  auto related = related_types(*model.find_namespace("shapes"), model);

  CHECK(related[shapes("Shape")] ==
        std::set<type_id>{shapes("Circle"), shapes("Square"),
                          shapes("UnknownShape")});
  CHECK(related[shapes("Circle")] ==
        std::set<type_id>{shapes("Shape"), shapes("Canvas")});
  CHECK(related[shapes("Dog")] == std::set<type_id>{shapes("Animal")});
  CHECK(related.count(shapes("Canvas")) == 0);
}
