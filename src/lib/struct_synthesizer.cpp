#include <csb/struct_synthesizer.hpp>

#include <csb/codegen_error.hpp>
#include <csb/doc_text.hpp>
#include <csb/xml_escape.hpp>

#include <algorithm>
#include <set>

namespace csb {

  namespace {

    bool
    is_required(const field& f) {
      return !f.has_default() && !f.type().is_nullable();
    }

  } // namespace

  struct_synthesizer::struct_synthesizer(const synthesis_context& ctx)
      : ctx_(ctx), constraints_(ctx.mapper), codec_(ctx.mapper) {}

  std::vector<field>
  struct_synthesizer::parameter_order(std::vector<field> fields) {
    std::stable_partition(fields.begin(), fields.end(), is_required);
    return fields;
  }

  std::string
  struct_synthesizer::member_name(const family_member& m) {
    auto& names = ctx_.mapper.names();
    if (m.tag) return names.public_name(*m.tag);
    return names.public_name(m.type->name().name());
  }

  cs_class
  struct_synthesizer::synthesize(const struct_type& s,
                                 const mapping_context& mapping) {
    auto& names = ctx_.mapper.names();
    const auto& class_name = names.public_name(s.name().name());
    const auto* parent = ctx_.hierarchy.enumerating_parent(s);

    // Fields a base class already declares are not repeated
    std::vector<field> own =
        parent ? s.fields() : ctx_.model.all_fields(s);
    auto all = ctx_.model.all_fields(s);

    cs_class cls;
    cls.doc = type_doc(s.doc(), names.name_words(s.name().name()));
    auto related = ctx_.related.find(s.name());
    if (related != ctx_.related.end()) {
      std::set<std::string> crefs;
      for (const auto& id : related->second)
        crefs.insert(ctx_.mapper.composite_name(id, mapping));
      for (const auto& cref : crefs) add_seealso(cls.doc, cref);
    }

    cls.access = s.has_enumerated_subtypes() ? "public" : "public sealed";
    cls.name = class_name;
    if (parent)
      cls.bases.push_back(ctx_.mapper.composite_name(parent->name(), mapping));
    cls.bases.push_back("enc.IEncodable<" + class_name + ">");

    cls.members.emplace_back(
        init_constructor(s, class_name, parent, own, mapping));
    if (!all.empty())
      cls.members.emplace_back(default_constructor(class_name, own, mapping));

    if (s.has_enumerated_subtypes()) add_subtype_accessors(cls, s, mapping);

    for (const auto& f : own) {
      cs_property p;
      if (!f.doc().empty())
        p.doc = summary_doc(f.doc());
      else
        p.doc = summary_doc("Gets the " + names.name_words(f.name()) +
                            " of the " + names.name_words(s.name().name()));
      p.access = "public";
      p.type = ctx_.mapper.map(f.type(), mapping, type_usage::property);
      p.name = names.public_name(f.name());
      p.setter_access = s.has_enumerated_subtypes() ? "protected" : "private";
      cls.members.emplace_back(std::move(p));
    }

    cs_region region;
    region.label = "IEncodable<" + class_name + "> methods";
    region.methods.push_back(encoder(s, class_name, mapping));
    region.methods.push_back(decoder(s, class_name, mapping));
    cls.members.emplace_back(std::move(region));

    return cls;
  }

  cs_constructor
  struct_synthesizer::init_constructor(const struct_type& s,
                                       const std::string& class_name,
                                       const struct_type* parent,
                                       const std::vector<field>& own,
                                       const mapping_context& mapping) {
    auto& names = ctx_.mapper.names();
    auto params = parameter_order(ctx_.model.all_fields(s));

    cs_constructor ctor;
    ctor.doc = constructor_doc(class_name);
    std::set<std::string> locals;
    for (const auto& f : params) {
      const auto& arg = names.arg_name(f.name());
      std::string doc_name = arg[0] == '@' ? arg.substr(1) : arg;
      locals.insert(doc_name);
      std::string text = f.doc().empty()
                             ? "The " + names.name_words(f.name())
                             : escape_text(f.doc());
      add_param(ctor.doc, doc_name, text);
      ctor.parameters.push_back(constraints_.parameter(f, mapping));
    }

    ctor.access = s.has_enumerated_subtypes() && !params.empty() ? "protected"
                                                                 : "public";
    ctor.name = class_name;

    if (parent) {
      for (const auto& f : parameter_order(ctx_.model.all_fields(*parent)))
        ctor.base_arguments.push_back(names.arg_name(f.name()));
    }

    cs_body body;
    std::vector<field_constraints> compiled;
    for (const auto& f : own) {
      compiled.push_back(constraints_.compile(f, mapping, locals));
      if (compiled.back().list_copy_element)
        locals.insert(compiled.back().list_local);
      constraints_.emit(body, compiled.back());
    }
    for (std::size_t i = 0; i < own.size(); ++i) {
      body.line("this." + names.public_name(own[i].name()) + " = " +
                compiled[i].stored_value() + ";");
    }
    ctor.body = body.str();
    return ctor;
  }

  cs_constructor
  struct_synthesizer::default_constructor(const std::string& class_name,
                                          const std::vector<field>& own,
                                          const mapping_context& mapping) {
    auto& names = ctx_.mapper.names();

    cs_constructor ctor;
    ctor.doc = constructor_doc(class_name);
    add_element(ctor.doc, "remarks",
                "This is to construct an instance of the object when "
                "deserializing.");
    ctor.access = "public";
    ctor.name = class_name;

    cs_body body;
    for (const auto& f : own) {
      std::string target = "this." + names.public_name(f.name());
      const auto& t = f.type().unwrap_nullable();
      if (f.has_default()) {
        constraints_.emit_default(body, f, target, mapping);
      } else if (t.is_list()) {
        body.line(target + " = new col.List<" +
                  ctx_.mapper.map(t.inner(), mapping) + ">();");
      }
    }
    ctor.body = body.str();
    return ctor;
  }

  void
  struct_synthesizer::add_subtype_accessors(cs_class& cls,
                                            const struct_type& s,
                                            const mapping_context& mapping) {
    for (const auto& m : ctx_.hierarchy.subtypes(s)) {
      auto suffix = member_name(m);
      auto type_name = ctx_.mapper.composite_name(m.type->name(), mapping);

      cs_property is;
      is.doc = markup_summary(
          "Gets a value indicating whether this instance is " + suffix);
      is.access = "public";
      is.type = "bool";
      is.name = "Is" + suffix;
      is.getter_body = "return this is " + type_name + ";\n";
      cls.members.emplace_back(std::move(is));

      cs_property as;
      as.doc = markup_summary("Gets this instance as a " + see_cref(type_name) +
                              ", or <c>null</c>.");
      as.access = "public";
      as.type = type_name;
      as.name = "As" + suffix;
      as.getter_body = "return this as " + type_name + ";\n";
      cls.members.emplace_back(std::move(as));
    }
  }

  cs_method
  struct_synthesizer::encoder(const struct_type& s,
                              const std::string& class_name,
                              const mapping_context& mapping) {
    auto all = ctx_.model.all_fields(s);
    cs_body body;

    auto write_object = [&](const std::optional<std::string>& tag) {
      body.open("using (var obj = encoder.AddObject())");
      if (tag) body.line(wire_codec::tag_statement(*tag));
      for (const auto& f : all) codec_.emit_encode(body, f, mapping);
      body.close();
    };

    if (s.has_enumerated_subtypes()) {
      bool first = true;
      for (const auto& m : ctx_.hierarchy.subtypes(s)) {
        auto suffix = member_name(m);
        auto type_name = ctx_.mapper.composite_name(m.type->name(), mapping);
        body.open(std::string(first ? "if" : "else if") + " (this.Is" +
                  suffix + ")");
        body.line("((enc.IEncodable<" + type_name + ">)this.As" + suffix +
                  ").Encode(encoder);");
        body.close();
        first = false;
      }
      body.open("else");
      if (s.is_catch_all())
        write_object(std::string());
      else
        body.line(invalid_state("\"No subtype of " + class_name +
                                " matches this instance\""));
      body.close();
    } else if (ctx_.hierarchy.enumerating_parent(s)) {
      write_object(ctx_.hierarchy.tag(s).value_or(std::string()));
    } else {
      write_object(std::nullopt);
    }

    return encode_method(class_name, body);
  }

  cs_method
  struct_synthesizer::decoder(const struct_type& s,
                              const std::string& class_name,
                              const mapping_context& mapping) {
    auto all = ctx_.model.all_fields(s);
    cs_body body;

    auto read_object = [&] {
      body.open("using (var obj = decoder.GetObject())");
      for (const auto& f : all) codec_.emit_decode(body, f, mapping);
      body.close();
      body.line();
      body.line("return this;");
    };

    auto delegate_to = [&](const struct_type& target) {
      auto type_name = ctx_.mapper.composite_name(target.name(), mapping);
      auto local = local_name(ctx_.mapper.names(), target.name().name());
      body.line("var " + local + " = new " + type_name + "();");
      body.line("return ((enc.IEncodable<" + type_name + ">)" + local +
                ").Decode(decoder);");
    };

    if (!s.has_enumerated_subtypes()) {
      read_object();
      return decode_method(class_name, body);
    }

    body.line("var tag = string.Empty;");
    body.open("using (var obj = decoder.GetObject())");
    body.line(std::string("tag = obj.GetField<string>(\"") + tag_entry +
              "\");");
    body.close();
    body.line();

    const auto* fallback = ctx_.hierarchy.catch_all(s);
    body.open("switch (tag)");
    for (const auto& m : ctx_.hierarchy.subtypes(s)) {
      if (!m.tag) continue;
      body.line("case " + wire_codec::string_literal(*m.tag) + ":");
      body.indent();
      delegate_to(*m.type);
      body.dedent();
    }
    body.line("default:");
    body.indent();
    if (fallback == &s) {
      read_object();
    } else if (fallback != nullptr) {
      delegate_to(*fallback);
    } else {
      body.line(invalid_state("\"Unknown tag: \" + tag"));
    }
    body.dedent();
    body.close();

    return decode_method(class_name, body);
  }

} // namespace csb
