#include <csb/synthesis_context.hpp>

#include <csb/doc_text.hpp>

namespace csb {

  namespace {

    const std::string suppress_attribute =
        "System.Diagnostics.CodeAnalysis.SuppressMessage(\"Microsoft.Design\", "
        "\"CA1033:InterfaceMethodsShouldBeCallableByChildTypes\")";

  } // namespace

  cs_doc
  type_doc(const std::string& doc, const std::string& words) {
    if (!doc.empty()) return summary_doc(doc);
    return summary_doc("The " + words + " object");
  }

  cs_method
  encode_method(const std::string& class_name, const cs_body& body) {
    cs_method m;
    m.doc = markup_summary("Encodes the object using the supplied encoder.");
    add_param(m.doc, "encoder",
              "The encoder being used to serialize the object.");
    m.attributes.push_back(suppress_attribute);
    m.return_type = "void";
    m.name = "enc.IEncodable<" + class_name + ">.Encode";
    m.parameters.push_back({"enc.IEncoder", "encoder", {}});
    m.body = body.str();
    return m;
  }

  cs_method
  decode_method(const std::string& class_name, const cs_body& body) {
    cs_method m;
    m.doc = markup_summary("Decodes an object using the supplied decoder.");
    add_param(m.doc, "decoder", "The decoder used to deserialize the object.");
    add_element(m.doc, "returns",
                "The deserialized object. Note: this is not necessarily the "
                "current instance.");
    m.attributes.push_back(suppress_attribute);
    m.return_type = class_name;
    m.name = "enc.IEncodable<" + class_name + ">.Decode";
    m.parameters.push_back({"enc.IDecoder", "decoder", {}});
    m.body = body.str();
    return m;
  }

  std::string
  local_name(name_cache& names, const std::string& schema_name) {
    std::string name = names.arg_name(schema_name);
    if (name == "tag" || name == "obj" || name == "encoder" ||
        name == "decoder")
      name += "Instance";
    return name;
  }

  std::string
  invalid_state(const std::string& message_expression) {
    return "throw new sys.InvalidOperationException(" + message_expression +
           ");";
  }

} // namespace csb
