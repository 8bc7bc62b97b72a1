#pragma once

#include <string>
#include <libsecret/secret.h>

class Secrets {
  public:
    Secrets();

    bool SaveSecret(const std::string &key, const std::string &value);
    std::string LoadSecret(const std::string &key);

    // Keyring first, then the environment variable.
    std::string LoadSecretOrEnv(const std::string &key, const char *env_name);

  private:
    SecretSchema m_Schema;
};
