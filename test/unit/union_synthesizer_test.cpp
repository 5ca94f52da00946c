#include <csb/expat_reader.hpp>
#include <csb/model_reader.hpp>
#include <csb/union_synthesizer.hpp>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <stdexcept>
#include <string>
#include <vector>

using namespace csb;

static const std::string model_xml = R"(
<api>
  <namespace name="shapes">
    <union name="Color">
      <field name="red"/>
      <field name="green"/>
      <field name="blue"/>
    </union>

    <struct name="Point">
      <field name="x" type="Int32"/>
    </struct>

    <union name="Marker" catch-all="other">
      <field name="point" type="Point"/>
      <field name="label" type="String" min-length="1"/>
      <field name="ids" type="List">
        <item type="Int64"/>
      </field>
      <field name="other"/>
    </union>

    <union name="Anything" catch-all="unknown">
      <field name="unknown"/>
    </union>

    <struct name="Pos">
      <field name="x" type="Int32"/>
    </struct>

    <union name="Spot">
      <field name="spot" type="Pos"/>
      <field name="none"/>
    </union>

    <union name="Anchor" catch-all="anchor">
      <field name="offset" type="Int32"/>
      <field name="anchor"/>
    </union>
  </namespace>
</api>
)";

static api
load(const std::string& xml) {
  expat_reader reader(xml);
  model_reader parser;
  api model;
  for (auto& ns : parser.parse(reader))
    model.add(std::move(ns));
  model.resolve();
  return model;
}

namespace {

  struct synth_fixture {
    api model;
    type_map types = type_map::defaults();
    name_cache names;
    type_mapper mapper{model, types, names, "Api"};
    hierarchy_resolver hierarchy{model};
    related_map related;
    synthesis_context ctx{model, mapper, hierarchy, related};
    mapping_context mapping{"shapes", name_scope{}};

    synth_fixture() : model(load(model_xml)) {}

    cs_class
    synthesize(const std::string& name) {
      union_synthesizer synth(ctx);
      return synth.synthesize(*model.find_union(type_id("shapes", name)),
                              mapping);
    }
  };

  template <typename T>
  std::vector<T>
  members_of(const cs_class& c) {
    std::vector<T> result;
    for (const auto& m : c.members) {
      if (const auto* p = std::get_if<T>(&m)) result.push_back(*p);
    }
    return result;
  }

  const cs_class&
  nested(const cs_class& c, const std::string& name) {
    for (const auto& n : c.nested) {
      if (n.name == name) return n;
    }
    throw std::runtime_error("no nested class " + name);
  }

} // namespace

// ---------------------------------------------------------------------------
// Closed union of void variants
// ---------------------------------------------------------------------------

TEST_CASE("union base class", "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Color");

  CHECK(cls.access == "public");
  CHECK(cls.bases == std::vector<std::string>{"enc.IEncodable<Color>"});
  CHECK(cls.doc.lines.at(0) == "<summary>The color object</summary>");

  auto ctors = members_of<cs_constructor>(cls);
  REQUIRE(ctors.size() == 1);
  CHECK(ctors[0].access == "public");
  CHECK(ctors[0].parameters.empty());

  auto props = members_of<cs_property>(cls);
  REQUIRE(props.size() == 6);
  CHECK(props[0].name == "IsRed");
  CHECK(props[0].getter_body == "return this is Red;\n");
  CHECK(props[1].name == "AsRed");
  CHECK(props[1].type == "Red");
  CHECK(props[5].name == "AsBlue");
}

TEST_CASE("closed union encode ends in an invalid-state error",
          "[union_synthesizer]") {
  synth_fixture fx;
  auto region = members_of<cs_region>(fx.synthesize("Color")).at(0);

  CHECK(region.methods.at(0).body ==
        "if (this.IsRed)\n"
        "{\n"
        "    ((enc.IEncodable<Red>)this).Encode(encoder);\n"
        "}\n"
        "else if (this.IsGreen)\n"
        "{\n"
        "    ((enc.IEncodable<Green>)this).Encode(encoder);\n"
        "}\n"
        "else if (this.IsBlue)\n"
        "{\n"
        "    ((enc.IEncodable<Blue>)this).Encode(encoder);\n"
        "}\n"
        "else\n"
        "{\n"
        "    throw new sys.InvalidOperationException(\"No variant of Color "
        "matches this instance\");\n"
        "}\n");
}

TEST_CASE("closed union rejects unknown tags", "[union_synthesizer]") {
  synth_fixture fx;
  auto region = members_of<cs_region>(fx.synthesize("Color")).at(0);

  CHECK(region.methods.at(1).return_type == "Color");
  CHECK(region.methods.at(1).body ==
        "var tag = decoder.GetUnionName();\n"
        "\n"
        "switch (tag)\n"
        "{\n"
        "    case \"red\":\n"
        "        return Red.Instance;\n"
        "    case \"green\":\n"
        "        return Green.Instance;\n"
        "    case \"blue\":\n"
        "        return Blue.Instance;\n"
        "    default:\n"
        "        throw new sys.InvalidOperationException(\"Unknown tag: \" + "
        "tag);\n"
        "}\n");
}

TEST_CASE("void variant is a singleton", "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Color");
  REQUIRE(cls.nested.size() == 3);
  const auto& red = nested(cls, "Red");

  CHECK(red.access == "public sealed");
  CHECK(red.bases == std::vector<std::string>{"Color", "enc.IEncodable<Red>"});

  auto ctors = members_of<cs_constructor>(red);
  REQUIRE(ctors.size() == 1);
  CHECK(ctors[0].access == "private");

  auto fields = members_of<cs_field>(red);
  REQUIRE(fields.size() == 1);
  CHECK(fields[0].modifiers == "public static readonly");
  CHECK(fields[0].type == "Red");
  CHECK(fields[0].name == "Instance");
  CHECK(fields[0].initializer == "new Red()");

  auto methods = members_of<cs_method>(red);
  REQUIRE(methods.size() == 2);
  CHECK(methods[0].body == "using (var obj = encoder.AddObject())\n"
                           "{\n"
                           "    obj.AddField<string>(\".tag\", \"red\");\n"
                           "}\n");
  CHECK(methods[1].body ==
        "throw new sys.InvalidOperationException(\"Decoding happens "
        "through the base class\");\n");
}

// ---------------------------------------------------------------------------
// Open union with value variants
// ---------------------------------------------------------------------------

TEST_CASE("open union encodes the catch-all last", "[union_synthesizer]") {
  synth_fixture fx;
  auto region = members_of<cs_region>(fx.synthesize("Marker")).at(0);
  const auto& body = region.methods.at(0).body;

  CHECK(body.find("if (this.IsPoint)\n") == 0);
  CHECK(body.find("else if (this.IsOther)") == std::string::npos);
  CHECK(body.find("else\n"
                  "{\n"
                  "    ((enc.IEncodable<Other>)this).Encode(encoder);\n"
                  "}\n") != std::string::npos);
}

TEST_CASE("open union decodes value variants and falls back to the "
          "catch-all",
          "[union_synthesizer]") {
  synth_fixture fx;
  auto region = members_of<cs_region>(fx.synthesize("Marker")).at(0);

  CHECK(region.methods.at(1).body ==
        "var tag = decoder.GetUnionName();\n"
        "\n"
        "switch (tag)\n"
        "{\n"
        "    case \"point\":\n"
        "        using (var obj = decoder.GetObject())\n"
        "        {\n"
        "            return new "
        "Point(obj.GetFieldObject<Api.Shapes.Point>(\"point\"));\n"
        "        }\n"
        "    case \"label\":\n"
        "        using (var obj = decoder.GetObject())\n"
        "        {\n"
        "            return new Label(obj.GetField<string>(\"label\"));\n"
        "        }\n"
        "    case \"ids\":\n"
        "        using (var obj = decoder.GetObject())\n"
        "        {\n"
        "            return new Ids(new "
        "col.List<long>(obj.GetFieldList<long>(\"ids\")));\n"
        "        }\n"
        "    default:\n"
        "        return Other.Instance;\n"
        "}\n");
}

TEST_CASE("variant shadowing a type qualifies the type",
          "[union_synthesizer]") {
  synth_fixture fx;
  const auto& point = nested(fx.synthesize("Marker"), "Point");

  auto ctors = members_of<cs_constructor>(point);
  REQUIRE(ctors.size() == 1);
  CHECK(ctors[0].access == "public");
  CHECK(ctors[0].parameters ==
        std::vector<cs_parameter>{{"Api.Shapes.Point", "value", ""}});
  CHECK(ctors[0].body == "if (value == null)\n"
                         "{\n"
                         "    throw new sys.ArgumentNullException(\"value\");\n"
                         "}\n"
                         "\n"
                         "this.Value = value;\n");

  auto props = members_of<cs_property>(point);
  REQUIRE(props.size() == 1);
  CHECK(props[0].name == "Value");
  CHECK(props[0].type == "Api.Shapes.Point");
  CHECK(props[0].setter_access == "private");

  auto methods = members_of<cs_method>(point);
  CHECK(methods.at(0).body ==
        "using (var obj = encoder.AddObject())\n"
        "{\n"
        "    obj.AddField<string>(\".tag\", \"point\");\n"
        "    obj.AddFieldObject<Api.Shapes.Point>(\"point\", this.Value);\n"
        "}\n");
}

TEST_CASE("variant constructors validate their value", "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Marker");

  auto label = members_of<cs_constructor>(nested(cls, "Label")).at(0);
  CHECK(label.body ==
        "if (value == null)\n"
        "{\n"
        "    throw new sys.ArgumentNullException(\"value\");\n"
        "}\n"
        "else if (value.Length < 1)\n"
        "{\n"
        "    throw new sys.ArgumentOutOfRangeException(\"value\");\n"
        "}\n"
        "\n"
        "this.Value = value;\n");

  auto ids = members_of<cs_constructor>(nested(cls, "Ids")).at(0);
  CHECK(ids.parameters ==
        std::vector<cs_parameter>{{"col.IEnumerable<long>", "value", ""}});
  CHECK(ids.body.find(
            "var valueList = new col.List<long>(value ?? new long[0]);") ==
        0);
  CHECK(ids.body.find("this.Value = valueList;") != std::string::npos);

  auto ids_props = members_of<cs_property>(nested(cls, "Ids"));
  CHECK(ids_props.at(0).type == "col.IList<long>");
}

TEST_CASE("union with only a catch-all", "[union_synthesizer]") {
  synth_fixture fx;
  auto region = members_of<cs_region>(fx.synthesize("Anything")).at(0);

  CHECK(region.methods.at(0).body ==
        "((enc.IEncodable<Unknown>)this).Encode(encoder);\n");
  CHECK(region.methods.at(1).body ==
        "var tag = decoder.GetUnionName();\n"
        "\n"
        "switch (tag)\n"
        "{\n"
        "    default:\n"
        "        return Unknown.Instance;\n"
        "}\n");
}

// ---------------------------------------------------------------------------
// Variant named like its union
// ---------------------------------------------------------------------------

TEST_CASE("variant named like its union gets a distinct class name",
          "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Spot");

  REQUIRE(cls.nested.size() == 2);
  CHECK(cls.nested[0].name == "SpotVariant");
  CHECK(cls.nested[1].name == "None");

  const auto& spot = nested(cls, "SpotVariant");
  CHECK(spot.bases == std::vector<std::string>{"Api.Shapes.Spot",
                                               "enc.IEncodable<SpotVariant>"});
  auto ctors = members_of<cs_constructor>(spot);
  REQUIRE(ctors.size() == 1);
  CHECK(ctors[0].name == "SpotVariant");
  CHECK(ctors[0].parameters ==
        std::vector<cs_parameter>{{"Pos", "value", ""}});

  CHECK(nested(cls, "None").bases ==
        std::vector<std::string>{"Api.Shapes.Spot", "enc.IEncodable<None>"});
}

TEST_CASE("union named like a variant refers to itself fully qualified",
          "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Spot");

  CHECK(cls.name == "Spot");
  CHECK(cls.bases ==
        std::vector<std::string>{"enc.IEncodable<Api.Shapes.Spot>"});

  auto props = members_of<cs_property>(cls);
  REQUIRE(props.size() == 4);
  CHECK(props[0].name == "IsSpot");
  CHECK(props[0].getter_body == "return this is SpotVariant;\n");
  CHECK(props[1].name == "AsSpot");
  CHECK(props[1].type == "SpotVariant");

  auto region = members_of<cs_region>(cls).at(0);
  const auto& encode = region.methods.at(0);
  CHECK(encode.name == "enc.IEncodable<Api.Shapes.Spot>.Encode");
  CHECK(encode.body.find("if (this.IsSpot)\n"
                         "{\n"
                         "    ((enc.IEncodable<SpotVariant>)this)"
                         ".Encode(encoder);\n"
                         "}\n") == 0);

  const auto& decode = region.methods.at(1);
  CHECK(decode.name == "enc.IEncodable<Api.Shapes.Spot>.Decode");
  CHECK(decode.return_type == "Api.Shapes.Spot");
  CHECK(decode.body.find(
            "return new SpotVariant(obj.GetFieldObject<Pos>(\"spot\"));") !=
        std::string::npos);
  CHECK(decode.body.find("return None.Instance;") != std::string::npos);
}

TEST_CASE("catch-all named like its union uses the renamed class",
          "[union_synthesizer]") {
  synth_fixture fx;
  auto cls = fx.synthesize("Anchor");
  auto region = members_of<cs_region>(cls).at(0);

  CHECK(region.methods.at(0).body.find(
            "else\n"
            "{\n"
            "    ((enc.IEncodable<AnchorVariant>)this).Encode(encoder);\n"
            "}\n") != std::string::npos);
  CHECK(region.methods.at(1).body.find("    default:\n"
                                       "        return AnchorVariant.Instance;"
                                       "\n") != std::string::npos);

  auto fields = members_of<cs_field>(nested(cls, "AnchorVariant"));
  REQUIRE(fields.size() == 1);
  CHECK(fields[0].type == "AnchorVariant");
  CHECK(fields[0].initializer == "new AnchorVariant()");

  CHECK(fx.mapper.literal(
            type_expr::reference_to(type_id("shapes", "Anchor")), "anchor",
            fx.mapping) == "Anchor.AnchorVariant.Instance");
}
