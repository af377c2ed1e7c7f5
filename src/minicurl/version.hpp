#ifndef MINICURL_VERSION_HPP
#define MINICURL_VERSION_HPP

#define MINICURL_VERSION "0.3.0"
#define MINICURL_USER_AGENT "minicurl/" MINICURL_VERSION

#endif // MINICURL_VERSION_HPP
