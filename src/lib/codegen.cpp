#include <csb/codegen.hpp>

#include <csb/codegen_error.hpp>
#include <csb/doc_text.hpp>
#include <csb/hierarchy.hpp>
#include <csb/naming.hpp>
#include <csb/struct_synthesizer.hpp>
#include <csb/synthesis_context.hpp>
#include <csb/type_mapper.hpp>
#include <csb/union_synthesizer.hpp>
#include <csb/xml_escape.hpp>

#include <set>
#include <utility>

namespace csb {

  codegen::codegen(const api& model, const type_map& types,
                   codegen_options options)
      : api_(model), types_(types), options_(std::move(options)) {}

  namespace {

    std::vector<std::vector<cs_using>>
    file_usings(const codegen_options& options) {
      return {
          {{"sys", "System"},
           {"col", "System.Collections.Generic"},
           {"re", "System.Text.RegularExpressions"}},
          {{"enc", options.runtime_namespace}},
      };
    }

  } // namespace

  std::vector<cs_file>
  codegen::generate() const {
    if (!api_.resolved())
      throw codegen_error("the model must be resolved before generation");

    // Per-run caches; nothing is shared with other runs
    name_cache names;
    type_mapper mapper(api_, types_, names, options_.root_namespace);
    hierarchy_resolver hierarchy(api_);

    std::vector<cs_file> files;
    std::set<std::string> paths;

    for (const auto& ns : api_.namespaces()) {
      auto related = related_types(ns, api_);
      synthesis_context ctx{api_, mapper, hierarchy, related};
      struct_synthesizer structs(ctx);
      union_synthesizer unions(ctx);

      const auto ns_name = names.public_name(ns.name());
      mapping_context mapping{ns.name(), name_scope{}};

      for (const auto& t : ns.data_types()) {
        cs_file file;
        file.path = ns_name + "/" + names.public_name(name_of(t).name()) + ".cs";
        file.namespace_name = options_.root_namespace + "." + ns_name;
        file.generator = options_.tool_name;
        file.usings = file_usings(options_);

        if (const auto* s = std::get_if<struct_type>(&t))
          file.type = structs.synthesize(*s, mapping);
        else
          file.type = unions.synthesize(std::get<union_type>(t), mapping);

        if (!paths.insert(file.path).second)
          throw codegen_error("two types map to '" + file.path + "'");
        files.push_back(std::move(file));
      }
    }

    return files;
  }

  cs_doc_file
  codegen::namespace_summaries() const {
    name_cache names;

    cs_doc_file file;
    file.path = "namespace_summaries.xml";
    file.assembly = "_NamespaceSummaries_";
    file.members.push_back(
        {"N:" + options_.root_namespace,
         markup_summary("Contains the types generated by " +
                        escape_text(options_.tool_name) + ".")});

    for (const auto& ns : api_.namespaces()) {
      const auto& ns_name = names.public_name(ns.name());
      auto doc = ns.doc().empty()
                     ? markup_summary("Contains the types declared in the <c>" +
                                      escape_text(ns.name()) +
                                      "</c> namespace.")
                     : summary_doc(ns.doc());
      file.members.push_back(
          {"N:" + options_.root_namespace + "." + ns_name, std::move(doc)});
    }
    return file;
  }

} // namespace csb
