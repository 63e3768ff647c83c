#ifndef CALCFLOW_PRIMITIVES_CLIENT_HPP
#define CALCFLOW_PRIMITIVES_CLIENT_HPP

#include <cstdint>
#include <string>

namespace calcflow::primitives {

  /**
   * @brief A remote target: FirecREST-like API endpoint, the credentials to
   * talk to it, and where on the remote machine calcjobs are run
   */
  struct Client {
    int64_t pk = 0;                   ///< primary key, set by the database
    std::string label;                ///< unique label
    std::string client_url;           ///< base url of the remote API
    std::string client_id;            ///< OAuth client id
    std::string client_secret;        ///< OAuth client secret
    std::string token_uri;            ///< OAuth token endpoint
    std::string machine_name;         ///< remote machine identifier
    std::string work_dir;             ///< remote working directory
    int64_t small_file_size_mb = 5;   ///< files up to this size are inlined

    /// @return size in bytes up to which a file is transferred inline
    uint64_t smallFileThreshold() const {
      return static_cast<uint64_t>(small_file_size_mb) * 1024 * 1024;
    }

    inline bool operator==(const Client &rhs) const {
      return pk == rhs.pk && label == rhs.label && client_url == rhs.client_url
             && client_id == rhs.client_id && client_secret == rhs.client_secret
             && token_uri == rhs.token_uri && machine_name == rhs.machine_name
             && work_dir == rhs.work_dir
             && small_file_size_mb == rhs.small_file_size_mb;
    }

    inline bool operator!=(const Client &rhs) const {
      return !operator==(rhs);
    }
  };
}  // namespace calcflow::primitives

#endif  // CALCFLOW_PRIMITIVES_CLIENT_HPP
