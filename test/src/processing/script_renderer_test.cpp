#include "processing/script_renderer.hpp"

#include <gtest/gtest.h>

#include "processing/processing_error.hpp"
#include "testutil/outcome_util.hpp"

using namespace calcflow::processing;
using calcflow::primitives::CalcJob;
using calcflow::primitives::Client;
using calcflow::primitives::Code;

class ScriptRendererTest : public ::testing::Test
{
public:
    void SetUp() override
    {
        client.label        = "daint";
        client.machine_name = "daint-gpu";
        client.work_dir     = "/scratch/user/";
        code.label          = "pw";
        calcjob.pk          = 7;
        calcjob.label       = "relax";
        calcjob.uuid        = "5f0e6a1c";
        calcjob.parameters  = { { "ecut", "40" }, { "text", "Hello world!" } };
    }

    Client  client;
    Code    code;
    CalcJob calcjob;
};

/**
 * @given a template referencing calcjob, code, client and parameters
 * @when it is rendered
 * @then every placeholder is substituted, with or without inner spaces
 */
TEST_F( ScriptRendererTest, SubstitutesPlaceholders )
{
    const std::string script_template = "#!/bin/bash\n"
                                        "#SBATCH --job-name={{calcjob.label}}-{{ calcjob.pk }}\n"
                                        "cd {{ remote_path }}\n"
                                        "echo '{{ parameters.text }}' > output.txt\n"
                                        "run --ecut {{parameters.ecut}} --on {{ client.machine_name }} # {{ code.label }}\n";
    std::string failed;
    EXPECT_OUTCOME_TRUE( script,
                         RenderScript( script_template, MakeTemplateValues( calcjob, code, client ), failed ) );
    EXPECT_EQ( script,
               "#!/bin/bash\n"
               "#SBATCH --job-name=relax-7\n"
               "cd /scratch/user/workflows/5f0e6a1c\n"
               "echo 'Hello world!' > output.txt\n"
               "run --ecut 40 --on daint-gpu # pw\n" );
    EXPECT_TRUE( failed.empty() );
}

TEST_F( ScriptRendererTest, PlainTextIsKept )
{
    std::string failed;
    EXPECT_OUTCOME_TRUE( script, RenderScript( "echo ${HOME} } {", {}, failed ) );
    EXPECT_EQ( script, "echo ${HOME} } {" );
}

/**
 * @given templates with an unknown or an unterminated placeholder
 * @when they are rendered
 * @then rendering fails and names the offending placeholder
 */
TEST_F( ScriptRendererTest, RejectsBadPlaceholders )
{
    auto        values = MakeTemplateValues( calcjob, code, client );
    std::string failed;
    EXPECT_OUTCOME_ERROR( RenderScript( "run {{ parameters.kpoints }}", values, failed ),
                          ProcessingError::TEMPLATE_ERROR );
    EXPECT_EQ( failed, "parameters.kpoints" );

    EXPECT_OUTCOME_ERROR( RenderScript( "run {{ calcjob.uuid", values, failed ), ProcessingError::TEMPLATE_ERROR );
    EXPECT_EQ( failed, "{{ calcjob.uuid" );
}
