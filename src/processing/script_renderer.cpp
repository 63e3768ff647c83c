#include "processing/script_renderer.hpp"

#include <boost/algorithm/string/trim.hpp>

#include "processing/processing_error.hpp"

namespace calcflow::processing
{
    namespace
    {
        constexpr const char *kOpen  = "{{";
        constexpr const char *kClose = "}}";
    }

    TemplateValues MakeTemplateValues( const primitives::CalcJob &calcjob,
                                       const primitives::Code    &code,
                                       const primitives::Client  &client )
    {
        TemplateValues values;
        values["calcjob.uuid"]        = calcjob.uuid;
        values["calcjob.label"]       = calcjob.label;
        values["calcjob.pk"]          = std::to_string( calcjob.pk );
        values["code.label"]          = code.label;
        values["client.label"]        = client.label;
        values["client.machine_name"] = client.machine_name;
        values["client.work_dir"]     = client.work_dir;
        values["remote_path"]         = calcjob.remotePath( client );
        for ( const auto &[key, value] : calcjob.parameters )
        {
            values["parameters." + key] = value;
        }
        return values;
    }

    outcome::result<std::string> RenderScript( const std::string    &script_template,
                                               const TemplateValues &values,
                                               std::string          &failed )
    {
        std::string rendered;
        rendered.reserve( script_template.size() );

        size_t position = 0;
        for ( ;; )
        {
            auto open = script_template.find( kOpen, position );
            if ( open == std::string::npos )
            {
                rendered.append( script_template, position, std::string::npos );
                return rendered;
            }
            rendered.append( script_template, position, open - position );

            auto close = script_template.find( kClose, open + 2 );
            if ( close == std::string::npos )
            {
                failed = script_template.substr( open, 32 );
                return ProcessingError::TEMPLATE_ERROR;
            }
            auto name = boost::algorithm::trim_copy( script_template.substr( open + 2, close - open - 2 ) );
            auto it   = values.find( name );
            if ( it == values.end() )
            {
                failed = name;
                return ProcessingError::TEMPLATE_ERROR;
            }
            rendered += it->second;
            position = close + 2;
        }
    }
}
