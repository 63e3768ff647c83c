#ifndef CALCFLOW_PROCESSING_SCRIPT_RENDERER_HPP
#define CALCFLOW_PROCESSING_SCRIPT_RENDERER_HPP

#include <map>
#include <string>

#include "outcome/outcome.hpp"
#include "primitives/calcjob.hpp"
#include "primitives/client.hpp"
#include "primitives/code.hpp"

namespace calcflow::processing
{
    /// placeholder name -> value
    using TemplateValues = std::map<std::string, std::string>;

    /**
     * @brief Values a job script template may reference:
     * calcjob.uuid, calcjob.label, calcjob.pk, parameters.<key>, code.label,
     * client.label, client.machine_name, client.work_dir and remote_path
     */
    TemplateValues MakeTemplateValues( const primitives::CalcJob &calcjob,
                                       const primitives::Code    &code,
                                       const primitives::Client  &client );

    /**
     * @brief Substitutes every {{ name }} placeholder of @param script_template
     * @param failed receives the offending placeholder on failure
     * @return ProcessingError::TEMPLATE_ERROR for an unknown or unterminated placeholder
     */
    outcome::result<std::string> RenderScript( const std::string    &script_template,
                                               const TemplateValues &values,
                                               std::string          &failed );
}

#endif
