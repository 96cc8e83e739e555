// Public header for the itemgate library
#pragma once

#include <ig/dictionary.h>
#include <ig/json.h>
#include <ig/tag.h>
#include <ig/schema.h>
#include <ig/classify.h>
#include <ig/validate.h>
#include <ig/schema_provider.h>
#include <ig/entry.h>
