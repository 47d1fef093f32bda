#pragma once

#include "lieko/v1/record.pb.h"

#include "lieko/v1/document_service.pb.h"
#include "lieko/v1/project_service.pb.h"
