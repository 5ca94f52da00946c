#include <csb/union_synthesizer.hpp>

#include <csb/codegen_error.hpp>
#include <csb/doc_text.hpp>

#include <vector>

namespace csb {

  const std::string&
  union_synthesizer::union_names::class_of(const std::string& variant_name,
                                           const union_type& u) const {
    const auto& fields = u.fields();
    for (std::size_t i = 0; i < fields.size(); ++i)
      if (fields[i].name() == variant_name) return classes[i];
    throw codegen_error("union '" + to_string(u.name()) +
                        "' has no variant '" + variant_name + "'");
  }

  union_synthesizer::union_synthesizer(const synthesis_context& ctx)
      : ctx_(ctx), constraints_(ctx.mapper), codec_(ctx.mapper) {}

  cs_class
  union_synthesizer::synthesize(const union_type& u,
                                const mapping_context& mapping) {
    auto& names = ctx_.mapper.names();

    union_names n;
    n.class_name = names.public_name(u.name().name());
    for (const auto& v : u.fields()) {
      n.variants.push_back(names.public_name(v.name()));
      n.classes.push_back(ctx_.mapper.variant_class_name(u, v.name()));
    }

    auto declared = n.variants;
    declared.insert(declared.end(), n.classes.begin(), n.classes.end());
    mapping_context scope{mapping.current_namespace,
                          mapping.scope.enter(declared)};
    n.self = ctx_.mapper.composite_name(u.name(), scope);

    cs_class cls;
    cls.doc = type_doc(u.doc(), names.name_words(u.name().name()));
    cls.access = "public";
    cls.name = n.class_name;
    cls.bases.push_back("enc.IEncodable<" + n.self + ">");

    cs_constructor ctor;
    ctor.doc = constructor_doc(n.class_name);
    ctor.access = "public";
    ctor.name = n.class_name;
    cls.members.emplace_back(std::move(ctor));

    for (std::size_t i = 0; i < n.variants.size(); ++i) {
      const auto& variant = n.variants[i];
      const auto& nested = n.classes[i];

      cs_property is;
      is.doc = markup_summary(
          "Gets a value indicating whether this instance is " + variant);
      is.access = "public";
      is.type = "bool";
      is.name = "Is" + variant;
      is.getter_body = "return this is " + nested + ";\n";
      cls.members.emplace_back(std::move(is));

      cs_property as;
      as.doc = markup_summary("Gets this instance as a " + see_cref(nested) +
                              ", or <c>null</c>.");
      as.access = "public";
      as.type = nested;
      as.name = "As" + variant;
      as.getter_body = "return this as " + nested + ";\n";
      cls.members.emplace_back(std::move(as));
    }

    cs_region region;
    region.label = "IEncodable<" + n.class_name + "> methods";
    region.methods.push_back(encoder(u, n));
    region.methods.push_back(decoder(u, n, scope));
    cls.members.emplace_back(std::move(region));

    for (std::size_t i = 0; i < u.fields().size(); ++i)
      cls.nested.push_back(variant_class(u.fields()[i], n.classes[i], n, scope));

    return cls;
  }

  cs_method
  union_synthesizer::encoder(const union_type& u, const union_names& n) {
    cs_body body;

    auto delegate = [&](const std::string& nested) {
      body.line("((enc.IEncodable<" + nested + ">)this).Encode(encoder);");
    };

    bool first = true;
    for (std::size_t i = 0; i < u.fields().size(); ++i) {
      if (u.catch_all_field() == u.fields()[i].name()) continue;
      body.open(std::string(first ? "if" : "else if") + " (this.Is" +
                n.variants[i] + ")");
      delegate(n.classes[i]);
      body.close();
      first = false;
    }

    if (u.catch_all_field()) {
      const auto& fallback = n.class_of(*u.catch_all_field(), u);
      if (first) {
        delegate(fallback);
      } else {
        body.open("else");
        delegate(fallback);
        body.close();
      }
    } else {
      if (!first) body.open("else");
      body.line(invalid_state("\"No variant of " + n.class_name +
                              " matches this instance\""));
      if (!first) body.close();
    }

    return encode_method(n.self, body);
  }

  cs_method
  union_synthesizer::decoder(const union_type& u, const union_names& n,
                             const mapping_context& scope) {
    cs_body body;

    body.line("var tag = decoder.GetUnionName();");
    body.line();
    body.open("switch (tag)");
    for (std::size_t i = 0; i < u.fields().size(); ++i) {
      const auto& v = u.fields()[i];
      if (u.catch_all_field() == v.name()) continue;
      const auto& nested = n.classes[i];
      body.line("case " + wire_codec::string_literal(v.name()) + ":");
      body.indent();
      if (v.is_void()) {
        body.line("return " + nested + ".Instance;");
      } else {
        body.open("using (var obj = decoder.GetObject())");
        body.line("return new " + nested + "(" +
                  codec_.get_expression(v.type(), v.name(), scope) + ");");
        body.close();
      }
      body.dedent();
    }
    body.line("default:");
    body.indent();
    if (u.catch_all_field())
      body.line("return " + n.class_of(*u.catch_all_field(), u) +
                ".Instance;");
    else
      body.line(invalid_state("\"Unknown tag: \" + tag"));
    body.dedent();
    body.close();

    return decode_method(n.self, body);
  }

  cs_class
  union_synthesizer::variant_class(const union_field& v,
                                   const std::string& class_name,
                                   const union_names& n,
                                   const mapping_context& scope) {
    auto& names = ctx_.mapper.names();

    cs_class cls;
    cls.doc = type_doc(v.doc(), names.name_words(v.name()));
    cls.access = "public sealed";
    cls.name = class_name;
    cls.bases = {n.self, "enc.IEncodable<" + class_name + ">"};

    cs_body encode;
    encode.open("using (var obj = encoder.AddObject())");
    encode.line(wire_codec::tag_statement(v.name()));

    if (v.is_void()) {
      cs_constructor ctor;
      ctor.doc = constructor_doc(class_name);
      ctor.access = "private";
      ctor.name = class_name;
      cls.members.emplace_back(std::move(ctor));

      cs_field instance;
      instance.doc = markup_summary("A singleton instance of " + class_name);
      instance.modifiers = "public static readonly";
      instance.type = class_name;
      instance.name = "Instance";
      instance.initializer = "new " + class_name + "()";
      cls.members.emplace_back(std::move(instance));
    } else {
      auto c = constraints_.compile("value", "value", v.type(), std::nullopt,
                                    scope);
      cs_body body;
      constraints_.emit(body, c);
      body.line("this.Value = " + c.stored_value() + ";");

      cs_constructor ctor;
      ctor.doc = constructor_doc(class_name);
      add_param(ctor.doc, "value", "The value");
      ctor.access = "public";
      ctor.name = class_name;
      ctor.parameters.push_back(
          {ctx_.mapper.map(v.type(), scope, type_usage::parameter), "value",
           {}});
      ctor.body = body.str();
      cls.members.emplace_back(std::move(ctor));

      cs_property value;
      value.doc = markup_summary("Gets the value of this instance.");
      value.access = "public";
      value.type = ctx_.mapper.map(v.type(), scope, type_usage::property);
      value.name = "Value";
      value.setter_access = "private";
      cls.members.emplace_back(std::move(value));

      encode.line(codec_.add_statement(v.type(), v.name(), "this.Value", scope));
    }
    encode.close();

    cs_body decode;
    decode.line(invalid_state("\"Decoding happens through the base class\""));

    cls.members.emplace_back(encode_method(class_name, encode));
    cls.members.emplace_back(decode_method(class_name, decode));
    return cls;
  }

} // namespace csb
