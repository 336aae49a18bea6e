#ifndef VALIDATION_ERROR_H
#define VALIDATION_ERROR_H

#include <string>

struct ValidationError {
    std::string path;     // dotted location, empty for the document root
    std::string message;
};

#endif // VALIDATION_ERROR_H
